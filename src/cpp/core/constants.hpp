#ifndef SPACECRAFT_TOOLS_CONSTANTS_HPP
#define SPACECRAFT_TOOLS_CONSTANTS_HPP

/**
 * @file constants.hpp
 * @brief Physical constants shared by the power and thermal models
 *
 * All values are in SI units unless noted otherwise.
 */

namespace spacecraft::core {

/// Pi constant
constexpr double PI = 3.14159265358979323846;

/// Stefan-Boltzmann constant (W / (m^2 K^4)), CODATA 2018 exact value
constexpr double STEFAN_BOLTZMANN = 5.670374419e-8;

/**
 * @brief Average total solar irradiance at 1 AU (W/m^2)
 *
 * Fluctuates by about +/- 0.1% over the 11-year solar cycle.
 */
constexpr double SOLAR_CONSTANT_1AU = 1366.0;

/// Astronomical unit (m), IAU 2012 definition
constexpr double ASTRONOMICAL_UNIT = 1.495978707e11;

/// Offset between the Kelvin and Celsius scales
constexpr double KELVIN_OFFSET = 273.15;

}  // namespace spacecraft::core

#endif  // SPACECRAFT_TOOLS_CONSTANTS_HPP
