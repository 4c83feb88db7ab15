#include "constants.hpp"



//-SI-PREFIXES---------------------------------------------------------------------------------------------------------

const huge_number &huge_constants::Yocto()
{
	static const huge_number value = huge_number(1, -24);
	return value;
}

const huge_number &huge_constants::Zepto()
{
	static const huge_number value = huge_number(1, -21);
	return value;
}

const huge_number &huge_constants::Atto()
{
	static const huge_number value = huge_number(1, -18);
	return value;
}

const huge_number &huge_constants::Femto()
{
	static const huge_number value = huge_number(1, -15);
	return value;
}

const huge_number &huge_constants::Pico()
{
	static const huge_number value = huge_number(1, -12);
	return value;
}

const huge_number &huge_constants::Nano()
{
	static const huge_number value = huge_number(1, -9);
	return value;
}

const huge_number &huge_constants::Micro()
{
	static const huge_number value = huge_number(1, -6);
	return value;
}

const huge_number &huge_constants::Milli()
{
	static const huge_number value = huge_number(1, 1000, 0);
	return value;
}

const huge_number &huge_constants::Centi()
{
	static const huge_number value = huge_number(1, 100, 0);
	return value;
}

const huge_number &huge_constants::Deci()
{
	static const huge_number value = huge_number(1, 10, 0);
	return value;
}

const huge_number &huge_constants::Deca()
{
	static const huge_number value = huge_number(10);
	return value;
}

const huge_number &huge_constants::Hecto()
{
	static const huge_number value = huge_number(100);
	return value;
}

const huge_number &huge_constants::Kilo()
{
	static const huge_number value = huge_number(1000);
	return value;
}

const huge_number &huge_constants::Mega()
{
	static const huge_number value = huge_number(1, 6);
	return value;
}

const huge_number &huge_constants::Giga()
{
	static const huge_number value = huge_number(1, 9);
	return value;
}

const huge_number &huge_constants::Tera()
{
	static const huge_number value = huge_number(1, 12);
	return value;
}

const huge_number &huge_constants::Peta()
{
	static const huge_number value = huge_number(1, 15);
	return value;
}

const huge_number &huge_constants::Exa()
{
	static const huge_number value = huge_number(1, 18);
	return value;
}

const huge_number &huge_constants::Zetta()
{
	static const huge_number value = huge_number(1, 21);
	return value;
}

const huge_number &huge_constants::Yotta()
{
	static const huge_number value = huge_number(1, 24);
	return value;
}



//-NUMBERS-------------------------------------------------------------------------------------------------------------

const huge_number &huge_constants::Half()
{
	static const huge_number value = huge_number(1, 2, 0);
	return value;
}

const huge_number &huge_constants::Third()
{
	static const huge_number value = huge_number(1, 3, 0);
	return value;
}

const huge_number &huge_constants::Fourth()
{
	static const huge_number value = huge_number(1, 4, 0);
	return value;
}

const huge_number &huge_constants::Eighth()
{
	static const huge_number value = huge_number(1, 8, 0);
	return value;
}

const huge_number &huge_constants::ThreeFourths()
{
	static const huge_number value = huge_number(3, 4, 0);
	return value;
}

const huge_number &huge_constants::ThreeHalves()
{
	static const huge_number value = huge_number(3, 2, 0);
	return value;
}

const huge_number &huge_constants::Two()
{
	static const huge_number value = huge_number(2);
	return value;
}

const huge_number &huge_constants::Ten()
{
	static const huge_number value = huge_number(10);
	return value;
}



//-MATHEMATICS---------------------------------------------------------------------------------------------------------

const huge_number &huge_constants::E()
{
	static const huge_number value = huge_number(271828182845904524, -17);
	return value;
}

const huge_number &huge_constants::InverseE()
{
	static const huge_number value = huge_number::One() / E();
	return value;
}

const huge_number &huge_constants::Pi()
{
	static const huge_number value = huge_number(314159265358979324, -17);
	return value;
}

const huge_number &huge_constants::Tau()
{
	static const huge_number value = huge_number(628318530717958648, -17);
	return value;
}

const huge_number &huge_constants::HalfPi()
{
	static const huge_number value = Pi() * Half();
	return value;
}

const huge_number &huge_constants::ThirdPi()
{
	static const huge_number value = Pi() * Third();
	return value;
}

const huge_number &huge_constants::QuarterPi()
{
	static const huge_number value = Pi() / 4;
	return value;
}

const huge_number &huge_constants::SixthPi()
{
	static const huge_number value = Pi() / 6;
	return value;
}

const huge_number &huge_constants::EighthPi()
{
	static const huge_number value = Pi() / 8;
	return value;
}

const huge_number &huge_constants::PiSquared()
{
	static const huge_number value = huge_number::Square(Pi());
	return value;
}

const huge_number &huge_constants::InversePi()
{
	static const huge_number value = huge_number::One() / Pi();
	return value;
}

const huge_number &huge_constants::PiOver180()
{
	static const huge_number value = Pi() / 180;
	return value;
}

const huge_number &huge_constants::OneEightyOverPi()
{
	static const huge_number value = huge_number(180) / Pi();
	return value;
}

const huge_number &huge_constants::Ln2()
{
	static const huge_number value = huge_number(693147180559945309, -18);
	return value;
}

const huge_number &huge_constants::Ln10()
{
	static const huge_number value = huge_number(230258509299404568, -17);
	return value;
}

const huge_number &huge_constants::Phi()
{
	static const huge_number value = huge_number(161803398874989485, -17);
	return value;
}

const huge_number &huge_constants::Root2()
{
	static const huge_number value = huge_number(141421356237309505, -17);
	return value;
}

const huge_number &huge_constants::FourPi()
{
	static const huge_number value = Tau() * Two();
	return value;
}

const huge_number &huge_constants::ThreePi()
{
	static const huge_number value = Tau() + Pi();
	return value;
}

const huge_number &huge_constants::ThreeHalvesPi()
{
	static const huge_number value = ThreePi() * Half();
	return value;
}

const huge_number &huge_constants::ThreeQuartersPi()
{
	static const huge_number value = ThreePi() / 4;
	return value;
}

const huge_number &huge_constants::FourThirdsPi()
{
	static const huge_number value = FourPi() * Third();
	return value;
}

const huge_number &huge_constants::TwoPiSquared()
{
	static const huge_number value = Two() * PiSquared();
	return value;
}



//-SCIENCE-------------------------------------------------------------------------------------------------------------

const huge_number &huge_constants::AvogadroConstant()
{
	static const huge_number value = huge_number(602214076, 15);
	return value;
}

const huge_number &huge_constants::BoltzmannConstant()
{
	static const huge_number value = huge_number(1380649, -29);
	return value;
}

const huge_number &huge_constants::ElectronMass()
{
	static const huge_number value = huge_number(910938356, -39);
	return value;
}

const huge_number &huge_constants::ElementaryCharge()
{
	static const huge_number value = huge_number(1602176634, -28);
	return value;
}

const huge_number &huge_constants::GravitationalConstant()
{
	static const huge_number value = huge_number(667408, -16);
	return value;
}

const huge_number &huge_constants::LightYear()
{
	static const huge_number value = huge_number(9460730472580800);
	return value;
}

const huge_number &huge_constants::MolarMassOfAir()
{
	static const huge_number value = huge_number(289644, -7);
	return value;
}

const huge_number &huge_constants::NeutronMass()
{
	static const huge_number value = huge_number(1674927471, -36);
	return value;
}

const huge_number &huge_constants::PlanckConstant()
{
	static const huge_number value = huge_number(662607015, -42);
	return value;
}

const huge_number &huge_constants::ProtonMass()
{
	static const huge_number value = huge_number(1672621898, -36);
	return value;
}

const huge_number &huge_constants::SpecificGasConstantOfDryAir()
{
	static const huge_number value = huge_number(287);
	return value;
}

const huge_number &huge_constants::SpecificGasConstantOfWater()
{
	static const huge_number value = huge_number(4615, -1);
	return value;
}

const huge_number &huge_constants::SpecificHeatOfDryAir()
{
	static const huge_number value = huge_number(10035, -1);
	return value;
}

const huge_number &huge_constants::SpeedOfLight()
{
	static const huge_number value = huge_number(299792458);
	return value;
}

const huge_number &huge_constants::SpeedOfLightSquared()
{
	static const huge_number value = huge_number::Square(SpeedOfLight());
	return value;
}

const huge_number &huge_constants::StandardAtmosphericPressure()
{
	static const huge_number value = huge_number(101325, -3);
	return value;
}

const huge_number &huge_constants::StefanBoltzmannConstant()
{
	static const huge_number value = huge_number(5670367, -14);
	return value;
}

const huge_number &huge_constants::UniversalGasConstant()
{
	static const huge_number value = huge_number(83144598, -7);
	return value;
}

// Derived quantities

const huge_number &huge_constants::TwoG()
{
	static const huge_number value = Two() * GravitationalConstant();
	return value;
}

const huge_number &huge_constants::FourSigma()
{
	static const huge_number value = huge_number(4) * StefanBoltzmannConstant();
	return value;
}

const huge_number &huge_constants::MAirOverR()
{
	static const huge_number value = MolarMassOfAir() / UniversalGasConstant();
	return value;
}

const huge_number &huge_constants::RSpecificRatioOfDryAirToWater()
{
	static const huge_number value = SpecificGasConstantOfDryAir() / SpecificGasConstantOfWater();
	return value;
}

const huge_number &huge_constants::CpTimesRSpecificDryAir()
{
	static const huge_number value = SpecificHeatOfDryAir() * SpecificGasConstantOfDryAir();
	return value;
}

const huge_number &huge_constants::RSpecificOverCpDryAir()
{
	static const huge_number value = SpecificGasConstantOfDryAir() / SpecificHeatOfDryAir();
	return value;
}
