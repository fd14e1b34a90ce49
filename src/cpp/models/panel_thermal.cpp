#include "panel_thermal.hpp"

#include <cmath>
#include <limits>

#include "core/diagnostics.hpp"
#include "core/math_utils.hpp"
#include "solar_array.hpp"

namespace spacecraft::models {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

constexpr const char* SOURCE = "panel_equilibrium_temperature";

}  // anonymous namespace

std::optional<double> equilibrium_temperature_kelvin(double sun_distance, double absorptivity,
                                                     double emissivity, double solar_constant) {
    std::optional<double> flux = solar_flux(sun_distance, solar_constant);
    if (!flux) {
        core::warn(SOURCE, "Input value sun_distance cannot be 0.");
        return std::nullopt;
    }

    // T = (α F / (2 ε σ))^(1/4)
    return std::pow((absorptivity * *flux) / (2.0 * emissivity * core::STEFAN_BOLTZMANN), 0.25);
}

std::optional<double> equilibrium_temperature_celsius(double sun_distance, double absorptivity,
                                                      double emissivity, double solar_constant) {
    std::optional<double> kelvin =
        equilibrium_temperature_kelvin(sun_distance, absorptivity, emissivity, solar_constant);
    if (!kelvin) {
        return std::nullopt;
    }
    return core::kelvin_to_celsius(*kelvin);
}

std::optional<double> panel_equilibrium_temperature(double sun_distance, double absorptivity,
                                                    double emissivity, double solar_constant) {
    std::optional<double> kelvin =
        equilibrium_temperature_kelvin(sun_distance, absorptivity, emissivity, solar_constant);
    if (!kelvin) {
        return std::nullopt;
    }
    // Historical scaling, kept bit-for-bit. Not a Celsius conversion.
    return *kelvin * core::KELVIN_OFFSET;
}

PanelThermalModel::PanelThermalModel(const PanelThermalParameters& params) : params_(params) {}

std::optional<double> PanelThermalModel::kelvin(double sun_distance) const {
    return equilibrium_temperature_kelvin(sun_distance, params_.absorptivity, params_.emissivity,
                                          params_.solar_constant);
}

std::optional<double> PanelThermalModel::celsius(double sun_distance) const {
    return equilibrium_temperature_celsius(sun_distance, params_.absorptivity, params_.emissivity,
                                           params_.solar_constant);
}

std::optional<double> PanelThermalModel::legacy_temperature(double sun_distance) const {
    return panel_equilibrium_temperature(sun_distance, params_.absorptivity, params_.emissivity,
                                         params_.solar_constant);
}

std::vector<double> PanelThermalModel::temperature_profile(
    const std::vector<double>& sun_distances) const {
    std::vector<double> temperatures(sun_distances.size());

    for (size_t i = 0; i < sun_distances.size(); ++i) {
        temperatures[i] = kelvin(sun_distances[i]).value_or(NaN);
    }

    return temperatures;
}

#ifdef SPACECRAFT_USE_EIGEN
Eigen::VectorXd PanelThermalModel::temperature_profile_eigen(
    const Eigen::VectorXd& sun_distances) const {
    Eigen::VectorXd temperatures(sun_distances.size());

#ifdef _OPENMP
#pragma omp parallel for schedule(static)
#endif
    for (Eigen::Index i = 0; i < sun_distances.size(); ++i) {
        temperatures(i) = kelvin(sun_distances(i)).value_or(NaN);
    }

    return temperatures;
}
#endif

}  // namespace spacecraft::models
