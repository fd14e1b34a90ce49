#ifndef SPACECRAFT_TOOLS_SOLAR_ARRAY_HPP
#define SPACECRAFT_TOOLS_SOLAR_ARRAY_HPP

/**
 * @file solar_array.hpp
 * @brief Flat photovoltaic panel power generation
 *
 * Reference: Wertz, J.R., & Larson, W.J. (1999). "Space Mission Analysis and
 * Design", 3rd ed., Section 11.4.
 *
 * The electrical output of a flat panel at distance r from the Sun is:
 *   P = (1/r²) * S * A * η * cos(θ)
 *
 * where S is the solar constant at 1 AU, A the effective cell area, η the
 * conversion efficiency and θ the angle between the sun vector and the panel
 * normal. Angles beyond 90° give negative power (panel facing away from the
 * Sun); the value is returned unclamped.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef SPACECRAFT_USE_EIGEN
#include <Eigen/Dense>
#endif

#include "core/constants.hpp"

namespace spacecraft::models {

/**
 * @brief Solar array configuration
 *
 * Parameters:
 * - effective_area: Area capable of generating power (m²)
 * - efficiency: Conversion efficiency, 1.0 = 100%
 * - incidence_angle: Sun vector to panel normal angle (degrees)
 * - solar_constant: Solar flux at 1 AU (W/m²)
 */
struct SolarArrayParameters {
    double effective_area;   ///< Generating area (m²)
    double efficiency;       ///< Conversion efficiency (fraction)
    double incidence_angle;  ///< Incidence angle (degrees)
    double solar_constant;   ///< Solar flux at 1 AU (W/m²)

    /// Default constructor: 1 m² of 28% cells, sun-pointing, at 1366 W/m²
    SolarArrayParameters()
        : effective_area(1.0),
          efficiency(0.28),
          incidence_angle(0.0),
          solar_constant(core::SOLAR_CONSTANT_1AU) {}

    /// Parameterized constructor
    SolarArrayParameters(double effective_area_, double efficiency_ = 0.28,
                         double incidence_angle_ = 0.0,
                         double solar_constant_ = core::SOLAR_CONSTANT_1AU)
        : effective_area(effective_area_),
          efficiency(efficiency_),
          incidence_angle(incidence_angle_),
          solar_constant(solar_constant_) {}

    /**
     * @brief Check the parameters describe a physical array
     *
     * Advisory only: the power functions accept any input.
     */
    bool is_valid() const noexcept {
        return effective_area >= 0.0 && efficiency >= 0.0 && efficiency <= 1.0 &&
               solar_constant > 0.0;
    }

    /**
     * @brief Validate parameters and throw if invalid
     * @throws std::invalid_argument if any parameter is out of range
     */
    void validate() const {
        if (effective_area < 0.0) {
            throw std::invalid_argument("SolarArray: effective_area must be non-negative, got " +
                                        std::to_string(effective_area));
        }
        if (efficiency < 0.0 || efficiency > 1.0) {
            throw std::invalid_argument("SolarArray: efficiency must be in [0, 1], got " +
                                        std::to_string(efficiency));
        }
        if (solar_constant <= 0.0) {
            throw std::invalid_argument("SolarArray: solar_constant must be positive, got " +
                                        std::to_string(solar_constant));
        }
    }

    /// String representation
    std::string to_string() const {
        return "SolarArrayParameters(effective_area=" + std::to_string(effective_area) +
               ", efficiency=" + std::to_string(efficiency) +
               ", incidence_angle=" + std::to_string(incidence_angle) +
               ", solar_constant=" + std::to_string(solar_constant) + ")";
    }
};

/**
 * @brief Solar flux at a given distance from the Sun
 *
 *   F = S / r²
 *
 * @param sun_distance Distance from the Sun (AU)
 * @param solar_constant Solar flux at 1 AU (W/m²)
 * @return Flux in W/m², or std::nullopt if sun_distance is zero
 */
std::optional<double> solar_flux(double sun_distance,
                                 double solar_constant = core::SOLAR_CONSTANT_1AU);

/**
 * @brief Electrical power generated by a flat solar panel
 *
 * A zero sun_distance is reported through core::warn() and yields
 * std::nullopt; no division is attempted. Other inputs are not checked.
 *
 * @param sun_distance Distance from the Sun (AU)
 * @param effective_area Generating area (m²)
 * @param efficiency Conversion efficiency (fraction)
 * @param incidence_angle Sun vector to panel normal angle (degrees)
 * @param solar_constant Solar flux at 1 AU (W/m²)
 * @return Generated power (W), or std::nullopt if sun_distance is zero
 */
std::optional<double> solar_array_power(double sun_distance, double effective_area,
                                        double efficiency = 0.28, double incidence_angle = 0.0,
                                        double solar_constant = core::SOLAR_CONSTANT_1AU);

/**
 * @brief Solar array with fixed configuration
 *
 * Evaluates power output for one array over one or many sun distances.
 */
class SolarArray {
public:
    explicit SolarArray(const SolarArrayParameters& params = SolarArrayParameters());

    const SolarArrayParameters& parameters() const noexcept { return params_; }

    void set_parameters(const SolarArrayParameters& params) { params_ = params; }

    /// Power at the configured incidence angle
    std::optional<double> power(double sun_distance) const;

    /// Power with the incidence angle overridden (degrees)
    std::optional<double> power_at(double sun_distance, double incidence_angle) const;

    /**
     * @brief Power for a series of sun distances
     *
     * Entries with a zero distance are set to quiet NaN (and warned about).
     *
     * @param sun_distances Distances from the Sun (AU)
     * @return Power per distance (W)
     */
    std::vector<double> power_profile(const std::vector<double>& sun_distances) const;

#ifdef SPACECRAFT_USE_EIGEN
    /**
     * @brief Power for a series of sun distances using Eigen vectors
     */
    Eigen::VectorXd power_profile_eigen(const Eigen::VectorXd& sun_distances) const;
#endif

private:
    SolarArrayParameters params_;
};

}  // namespace spacecraft::models

#endif  // SPACECRAFT_TOOLS_SOLAR_ARRAY_HPP
