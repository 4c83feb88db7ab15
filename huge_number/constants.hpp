#pragma once

#include "huge_number.hpp"

// Named values, each built on first use from the public constructors and operators
class huge_constants {
public:

	//-SI-PREFIXES-----------------------------------------------------------------------------------------------------

	static const huge_number &Yocto();
	static const huge_number &Zepto();
	static const huge_number &Atto();
	static const huge_number &Femto();
	static const huge_number &Pico();
	static const huge_number &Nano();
	static const huge_number &Micro();
	static const huge_number &Milli();
	static const huge_number &Centi();
	static const huge_number &Deci();
	static const huge_number &Deca();
	static const huge_number &Hecto();
	static const huge_number &Kilo();
	static const huge_number &Mega();
	static const huge_number &Giga();
	static const huge_number &Tera();
	static const huge_number &Peta();
	static const huge_number &Exa();
	static const huge_number &Zetta();
	static const huge_number &Yotta();



	//-NUMBERS---------------------------------------------------------------------------------------------------------

	static const huge_number &Half();
	static const huge_number &Third();
	static const huge_number &Fourth();
	static const huge_number &Eighth();
	static const huge_number &ThreeFourths();
	static const huge_number &ThreeHalves();
	static const huge_number &Two();
	static const huge_number &Ten();



	//-MATHEMATICS-----------------------------------------------------------------------------------------------------

	static const huge_number &E();
	static const huge_number &InverseE();
	static const huge_number &Pi();
	static const huge_number &Tau();
	static const huge_number &HalfPi();
	static const huge_number &ThirdPi();
	static const huge_number &QuarterPi();
	static const huge_number &SixthPi();
	static const huge_number &EighthPi();
	static const huge_number &PiSquared();
	static const huge_number &InversePi();
	static const huge_number &PiOver180();
	static const huge_number &OneEightyOverPi();
	static const huge_number &Ln2();
	static const huge_number &Ln10();
	static const huge_number &Phi();
	static const huge_number &Root2();
	static const huge_number &FourPi();
	static const huge_number &ThreePi();
	static const huge_number &ThreeHalvesPi();
	static const huge_number &ThreeQuartersPi();
	static const huge_number &FourThirdsPi();
	static const huge_number &TwoPiSquared();



	//-SCIENCE---------------------------------------------------------------------------------------------------------
	// SI units

	static const huge_number &AvogadroConstant();
	static const huge_number &BoltzmannConstant();
	static const huge_number &ElectronMass();
	static const huge_number &ElementaryCharge();
	static const huge_number &GravitationalConstant();
	static const huge_number &LightYear();
	static const huge_number &MolarMassOfAir();
	static const huge_number &NeutronMass();
	static const huge_number &PlanckConstant();
	static const huge_number &ProtonMass();
	static const huge_number &SpecificGasConstantOfDryAir();
	static const huge_number &SpecificGasConstantOfWater();
	static const huge_number &SpecificHeatOfDryAir();
	static const huge_number &SpeedOfLight();
	static const huge_number &SpeedOfLightSquared();
	static const huge_number &StandardAtmosphericPressure();
	static const huge_number &StefanBoltzmannConstant();
	static const huge_number &UniversalGasConstant();

	// Derived quantities
	static const huge_number &TwoG();
	static const huge_number &FourSigma();
	static const huge_number &MAirOverR();
	static const huge_number &RSpecificRatioOfDryAirToWater();
	static const huge_number &CpTimesRSpecificDryAir();
	static const huge_number &RSpecificOverCpDryAir();
};
