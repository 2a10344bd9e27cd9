// Physical constants and unit conversions

#pragma once
#ifndef CONSTANTS_H
#define CONSTANTS_H

namespace Constants {
	// Boltzmann's constant [kJ/mol/K]
	static constexpr double k_B = 8.314e-3;

	// beta = 1/(k_B*T) [mol/kJ], for a temperature T in K
	inline double inverseTemperature(const double temperature) {
		return 1.0/(k_B*temperature);
	}
};

#endif // ifndef CONSTANTS_H
