#include "math_utils.hpp"

#include "constants.hpp"

namespace spacecraft::core {

double deg_to_rad(double deg) {
    return deg * (PI / 180.0);
}

double rad_to_deg(double rad) {
    return rad * (180.0 / PI);
}

double inverse_square(double distance) {
    if (distance == 0.0) {
        throw std::invalid_argument("Cannot compute inverse square of zero distance");
    }
    return 1.0 / (distance * distance);
}

double kelvin_to_celsius(double kelvin) {
    return kelvin - KELVIN_OFFSET;
}

double celsius_to_kelvin(double celsius) {
    return celsius + KELVIN_OFFSET;
}

} // namespace spacecraft::core
