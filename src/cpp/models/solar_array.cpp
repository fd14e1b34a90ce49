#include "solar_array.hpp"

#include <cmath>
#include <limits>

#include "core/diagnostics.hpp"
#include "core/math_utils.hpp"

namespace spacecraft::models {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

}  // anonymous namespace

std::optional<double> solar_flux(double sun_distance, double solar_constant) {
    if (sun_distance == 0.0) {
        return std::nullopt;
    }
    return solar_constant * core::inverse_square(sun_distance);
}

std::optional<double> solar_array_power(double sun_distance, double effective_area,
                                        double efficiency, double incidence_angle,
                                        double solar_constant) {
    if (sun_distance == 0.0) {
        core::warn("solar_array_power", "Input value sun_distance cannot be 0.");
        return std::nullopt;
    }

    // P = (1/r²) * S * A * η * cos(θ)
    const double distance_ratio = core::inverse_square(sun_distance);
    return distance_ratio * solar_constant * effective_area * efficiency *
           std::cos(core::deg_to_rad(incidence_angle));
}

SolarArray::SolarArray(const SolarArrayParameters& params) : params_(params) {}

std::optional<double> SolarArray::power(double sun_distance) const {
    return power_at(sun_distance, params_.incidence_angle);
}

std::optional<double> SolarArray::power_at(double sun_distance, double incidence_angle) const {
    return solar_array_power(sun_distance, params_.effective_area, params_.efficiency,
                             incidence_angle, params_.solar_constant);
}

std::vector<double> SolarArray::power_profile(const std::vector<double>& sun_distances) const {
    std::vector<double> powers(sun_distances.size());

    for (size_t i = 0; i < sun_distances.size(); ++i) {
        powers[i] = power(sun_distances[i]).value_or(NaN);
    }

    return powers;
}

#ifdef SPACECRAFT_USE_EIGEN
Eigen::VectorXd SolarArray::power_profile_eigen(const Eigen::VectorXd& sun_distances) const {
    Eigen::VectorXd powers(sun_distances.size());

#ifdef _OPENMP
#pragma omp parallel for schedule(static)
#endif
    for (Eigen::Index i = 0; i < sun_distances.size(); ++i) {
        powers(i) = power(sun_distances(i)).value_or(NaN);
    }

    return powers;
}
#endif

}  // namespace spacecraft::models
