#ifndef SPACECRAFT_TOOLS_PANEL_THERMAL_HPP
#define SPACECRAFT_TOOLS_PANEL_THERMAL_HPP

/**
 * @file panel_thermal.hpp
 * @brief Radiative equilibrium temperature of a flat panel
 *
 * A thin flat panel facing the Sun absorbs α·F on one face and radiates from
 * both faces. At steady state (Stefan-Boltzmann law):
 *   α F = 2 ε σ T⁴   =>   T = (α F / (2 ε σ))^(1/4)
 *
 * with F = S / r² the solar flux at distance r.
 *
 * Three readings of the result are provided:
 * - equilibrium_temperature_kelvin: T in Kelvin
 * - equilibrium_temperature_celsius: T - 273.15
 * - panel_equilibrium_temperature: T * 273.15, the value produced by the
 *   legacy tool under the "Celsius" label. This is NOT a temperature in any
 *   standard scale; it is kept so existing results can be reproduced.
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
 * @brief Panel surface properties
 *
 * Parameters:
 * - absorptivity: Fraction of incident solar energy absorbed (1.0 = black body)
 * - emissivity: Infrared emission effectiveness of the surface
 * - solar_constant: Solar flux at 1 AU (W/m²)
 */
struct PanelThermalParameters {
    double absorptivity;    ///< Solar absorptivity α
    double emissivity;      ///< Infrared emissivity ε
    double solar_constant;  ///< Solar flux at 1 AU (W/m²)

    /// Default constructor with typical solar cell surface properties
    PanelThermalParameters()
        : absorptivity(0.85), emissivity(0.72), solar_constant(core::SOLAR_CONSTANT_1AU) {}

    /// Parameterized constructor
    PanelThermalParameters(double absorptivity_, double emissivity_,
                           double solar_constant_ = core::SOLAR_CONSTANT_1AU)
        : absorptivity(absorptivity_), emissivity(emissivity_), solar_constant(solar_constant_) {}

    /// α/ε, the surface property that sets the equilibrium temperature
    double absorptance_ratio() const { return absorptivity / emissivity; }

    bool is_valid() const noexcept {
        return absorptivity >= 0.0 && absorptivity <= 1.0 && emissivity > 0.0 &&
               emissivity <= 1.0 && solar_constant > 0.0;
    }

    /**
     * @brief Validate parameters and throw if invalid
     * @throws std::invalid_argument if any parameter is out of range
     */
    void validate() const {
        if (absorptivity < 0.0 || absorptivity > 1.0) {
            throw std::invalid_argument("PanelThermal: absorptivity must be in [0, 1], got " +
                                        std::to_string(absorptivity));
        }
        if (emissivity <= 0.0 || emissivity > 1.0) {
            throw std::invalid_argument("PanelThermal: emissivity must be in (0, 1], got " +
                                        std::to_string(emissivity));
        }
        if (solar_constant <= 0.0) {
            throw std::invalid_argument("PanelThermal: solar_constant must be positive, got " +
                                        std::to_string(solar_constant));
        }
    }

    /// String representation
    std::string to_string() const {
        return "PanelThermalParameters(absorptivity=" + std::to_string(absorptivity) +
               ", emissivity=" + std::to_string(emissivity) +
               ", solar_constant=" + std::to_string(solar_constant) + ")";
    }
};

/**
 * @brief Equilibrium panel temperature in Kelvin
 *
 * A zero sun_distance is reported through core::warn() and yields
 * std::nullopt; no division is attempted.
 *
 * @param sun_distance Distance from the Sun (AU)
 * @param absorptivity Solar absorptivity α
 * @param emissivity Infrared emissivity ε
 * @param solar_constant Solar flux at 1 AU (W/m²)
 * @return Temperature (K), or std::nullopt if sun_distance is zero
 */
std::optional<double> equilibrium_temperature_kelvin(
    double sun_distance, double absorptivity = 0.85, double emissivity = 0.72,
    double solar_constant = core::SOLAR_CONSTANT_1AU);

/**
 * @brief Equilibrium panel temperature in degrees Celsius (T_K - 273.15)
 */
std::optional<double> equilibrium_temperature_celsius(
    double sun_distance, double absorptivity = 0.85, double emissivity = 0.72,
    double solar_constant = core::SOLAR_CONSTANT_1AU);

/**
 * @brief Legacy equilibrium temperature value (T_K * 273.15)
 *
 * Reproduces the historical output of the panel temperature tool, which
 * multiplies by the Kelvin offset instead of subtracting it. Use
 * equilibrium_temperature_celsius() for an actual Celsius value.
 */
std::optional<double> panel_equilibrium_temperature(
    double sun_distance, double absorptivity = 0.85, double emissivity = 0.72,
    double solar_constant = core::SOLAR_CONSTANT_1AU);

/**
 * @brief Flat panel thermal model with fixed surface properties
 */
class PanelThermalModel {
public:
    explicit PanelThermalModel(const PanelThermalParameters& params = PanelThermalParameters());

    const PanelThermalParameters& parameters() const noexcept { return params_; }

    void set_parameters(const PanelThermalParameters& params) { params_ = params; }

    std::optional<double> kelvin(double sun_distance) const;

    std::optional<double> celsius(double sun_distance) const;

    /// See panel_equilibrium_temperature()
    std::optional<double> legacy_temperature(double sun_distance) const;

    /**
     * @brief Kelvin temperature for a series of sun distances
     *
     * Entries with a zero distance are set to quiet NaN (and warned about).
     */
    std::vector<double> temperature_profile(const std::vector<double>& sun_distances) const;

#ifdef SPACECRAFT_USE_EIGEN
    Eigen::VectorXd temperature_profile_eigen(const Eigen::VectorXd& sun_distances) const;
#endif

private:
    PanelThermalParameters params_;
};

}  // namespace spacecraft::models

#endif  // SPACECRAFT_TOOLS_PANEL_THERMAL_HPP
