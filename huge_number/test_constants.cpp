#include "huge_number.hpp"
#include "constants.hpp"

#include <gtest/gtest.h>

static const huge_number Tolerance(1, -15);

TEST(Constants, prefixes)
{
	ASSERT_EQ(huge_number(1, -24), huge_constants::Yocto());
	ASSERT_EQ(huge_number(1, 100, 0), huge_constants::Centi());
	ASSERT_EQ(huge_number(1, 10, 0), huge_constants::Deci());
	ASSERT_EQ(huge_number(1, 1000, 0), huge_constants::Milli());
	ASSERT_EQ(0, huge_number::CompareTo(huge_number(1, -2), huge_constants::Centi()));
	ASSERT_EQ(huge_number::One(), huge_constants::Centi() * huge_constants::Hecto());
	ASSERT_EQ(huge_number::One(), huge_constants::Deci() * huge_constants::Deca());
	ASSERT_EQ(huge_number(1000), huge_constants::Kilo());
	ASSERT_EQ(huge_number(1, 18), huge_constants::Exa());
	ASSERT_EQ(huge_number::One(), huge_constants::Milli() * huge_constants::Kilo());
	ASSERT_EQ(huge_number::One(), huge_constants::Yocto() * huge_constants::Yotta());
}

TEST(Constants, fractions)
{
	ASSERT_EQ(huge_number(1, 2, 0), huge_constants::Half());
	ASSERT_EQ(huge_number::One(), huge_constants::Third() * huge_number(3));
	ASSERT_EQ(huge_constants::ThreeFourths(), huge_constants::Half() + huge_constants::Fourth());
	ASSERT_EQ(huge_constants::ThreeHalves(), huge_number::One() + huge_constants::Half());
	ASSERT_EQ(huge_constants::Fourth(), huge_constants::Eighth() * huge_constants::Two());
}

TEST(Constants, mathematics)
{
	ASSERT_EQ(huge_constants::Tau(), huge_constants::Pi() * huge_constants::Two());
	ASSERT_TRUE(huge_constants::HalfPi().isNearlyEqualTo(huge_number::Asin(huge_number::One()), Tolerance));
	ASSERT_TRUE(huge_constants::Pi().isNearlyEqualTo(huge_number::Acos(huge_number::NegativeOne()), Tolerance));
	ASSERT_TRUE(huge_constants::E().isNearlyEqualTo(huge_number::Exp(huge_number::One()), Tolerance));
	ASSERT_TRUE((huge_constants::E() * huge_constants::InverseE()).isNearlyEqualTo(huge_number::One(), Tolerance));
	ASSERT_TRUE((huge_constants::PiOver180() * huge_constants::OneEightyOverPi()).isNearlyEqualTo(huge_number::One(), Tolerance));
	ASSERT_TRUE(huge_number::Square(huge_constants::Root2()).isNearlyEqualTo(huge_number(2), Tolerance));
	ASSERT_TRUE((huge_number::Square(huge_constants::Phi()) - huge_constants::Phi()).isNearlyEqualTo(huge_number::One(), Tolerance));
}

TEST(Constants, multiplesOfPi)
{
	ASSERT_EQ(huge_number(12566370614359173, -15), huge_constants::FourPi());
	ASSERT_EQ(huge_constants::Pi() * huge_number(3), huge_constants::ThreePi());
	ASSERT_TRUE(huge_constants::ThreeHalvesPi().isNearlyEqualTo(huge_constants::HalfPi() * huge_number(3), Tolerance));
	ASSERT_TRUE(huge_constants::ThreeQuartersPi().isNearlyEqualTo(huge_constants::QuarterPi() * huge_number(3), Tolerance));
	ASSERT_TRUE(huge_constants::FourThirdsPi().isNearlyEqualTo(huge_constants::ThirdPi() * huge_number(4), Tolerance));
	ASSERT_TRUE(huge_constants::TwoPiSquared().isNearlyEqualTo(huge_constants::PiSquared() * huge_number(2), Tolerance));
}

TEST(Constants, science)
{
	ASSERT_EQ(huge_number(299792458), huge_constants::SpeedOfLight());
	ASSERT_EQ(huge_number(89875517873681764), huge_constants::SpeedOfLightSquared());
	ASSERT_EQ(huge_number(101325, -3), huge_constants::StandardAtmosphericPressure());
	ASSERT_EQ(huge_number(602214076, 15), huge_constants::AvogadroConstant());
	ASSERT_TRUE(huge_constants::PlanckConstant().isNearlyZero());
}

TEST(Constants, derivedQuantities)
{
	ASSERT_EQ(huge_number(1334816, -16), huge_constants::TwoG());
	ASSERT_EQ(huge_number(22681468, -14), huge_constants::FourSigma());
	ASSERT_EQ(huge_number(2880045, -1), huge_constants::CpTimesRSpecificDryAir());
	ASSERT_TRUE(huge_constants::RSpecificRatioOfDryAirToWater().isNearlyEqualTo(huge_number(621885157096424702, -18), Tolerance));
	ASSERT_TRUE(huge_constants::RSpecificOverCpDryAir().isNearlyEqualTo(huge_number(285999003487792725, -18), Tolerance));
	ASSERT_TRUE(huge_constants::MAirOverR().isNearlyEqualTo(huge_number(348361778115759246, -20), Tolerance));
}
