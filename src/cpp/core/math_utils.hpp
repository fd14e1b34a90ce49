#ifndef SPACECRAFT_TOOLS_MATH_UTILS_HPP
#define SPACECRAFT_TOOLS_MATH_UTILS_HPP

/**
 * @file math_utils.hpp
 * @brief Core scalar utilities for the spacecraft engineering models
 *
 * Provides the small numerical building blocks used across the library:
 * - Angle conversions
 * - Inverse-square distance scaling
 * - Temperature scale conversions
 */

#include <cmath>
#include <stdexcept>

namespace spacecraft::core {

/**
 * @brief Convert an angle from degrees to radians
 * @param deg Angle in degrees
 * @return Angle in radians
 */
double deg_to_rad(double deg);

/**
 * @brief Convert an angle from radians to degrees
 * @param rad Angle in radians
 * @return Angle in degrees
 */
double rad_to_deg(double rad);

/**
 * @brief Inverse-square scaling factor 1 / r^2
 * @param distance Distance r (any unit, result is in that unit^-2)
 * @return 1 / distance^2
 * @throws std::invalid_argument if distance is exactly zero
 */
double inverse_square(double distance);

/**
 * @brief Convert a temperature from Kelvin to degrees Celsius
 */
double kelvin_to_celsius(double kelvin);

/**
 * @brief Convert a temperature from degrees Celsius to Kelvin
 */
double celsius_to_kelvin(double celsius);

} // namespace spacecraft::core

#endif // SPACECRAFT_TOOLS_MATH_UTILS_HPP
