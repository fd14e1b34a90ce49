/**
 * @file power_bindings.cpp
 * @brief pybind11 bindings for solar array power generation
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "models/solar_array.hpp"

namespace py = pybind11;
using namespace spacecraft::models;

void bind_solar_array(py::module_& m) {
    // ============== SolarArrayParameters struct ==============
    py::class_<SolarArrayParameters>(m, "SolarArrayParameters",
        R"doc(
        Solar array configuration.

        Attributes:
            effective_area: Area capable of generating power (m^2)
            efficiency: Conversion efficiency, 1.0 = 100%
            incidence_angle: Angle between sun vector and panel normal (deg)
            solar_constant: Solar flux at 1 AU (W/m^2)
        )doc")
        .def(py::init<>(),
             "Construct with default parameters (1 m^2, 28%, sun-pointing)")
        .def(py::init<double, double, double, double>(),
             py::arg("effective_area"),
             py::arg("efficiency") = 0.28,
             py::arg("incidence_angle") = 0.0,
             py::arg("solar_constant") = spacecraft::core::SOLAR_CONSTANT_1AU,
             "Construct with specified parameters")
        .def_readwrite("effective_area", &SolarArrayParameters::effective_area)
        .def_readwrite("efficiency", &SolarArrayParameters::efficiency)
        .def_readwrite("incidence_angle", &SolarArrayParameters::incidence_angle)
        .def_readwrite("solar_constant", &SolarArrayParameters::solar_constant)
        .def("is_valid", &SolarArrayParameters::is_valid,
             "Check area >= 0, efficiency in [0, 1] and solar_constant > 0")
        .def("validate", &SolarArrayParameters::validate,
             "Validate parameters and raise ValueError if invalid")
        .def("__repr__", &SolarArrayParameters::to_string);

    // ============== SolarArray class ==============
    py::class_<SolarArray>(m, "SolarArray",
        R"doc(
        Solar array with fixed configuration.

        Example:
            >>> array = SolarArray(SolarArrayParameters(2.0, 0.3))
            >>> array.power(1.0)
            819.6
        )doc")
        .def(py::init<const SolarArrayParameters&>(),
             py::arg("params") = SolarArrayParameters())
        .def_property("parameters", &SolarArray::parameters, &SolarArray::set_parameters)
        .def("power", &SolarArray::power,
             py::arg("sun_distance"),
             "Power (W) at the configured incidence angle, or None if sun_distance is 0")
        .def("power_at", &SolarArray::power_at,
             py::arg("sun_distance"),
             py::arg("incidence_angle"),
             "Power (W) with the incidence angle overridden (deg)")
        .def("power_profile", &SolarArray::power_profile_eigen,
             py::arg("sun_distances"),
             R"doc(
             Power for an array of sun distances.

             Args:
                 sun_distances: NumPy array of distances (AU)

             Returns:
                 NumPy array of powers (W), NaN where sun_distance is 0
             )doc");

    m.def("solar_flux", &solar_flux,
          py::arg("sun_distance"),
          py::arg("solar_constant") = spacecraft::core::SOLAR_CONSTANT_1AU,
          "Solar flux (W/m^2) at sun_distance (AU), or None if sun_distance is 0");

    m.def("solar_array_power", &solar_array_power,
          py::arg("sun_distance"),
          py::arg("effective_area"),
          py::arg("efficiency") = 0.28,
          py::arg("incidence_angle") = 0.0,
          py::arg("solar_constant") = spacecraft::core::SOLAR_CONSTANT_1AU,
          R"doc(
          Calculate solar panel / array power generation.

          P = (1/r^2) * S * A * efficiency * cos(incidence_angle)

          Args:
              sun_distance: Distance from the Sun (AU)
              effective_area: Generating area (m^2)
              efficiency: Conversion efficiency, 1.0 = 100%
              incidence_angle: Angle between sun vector and panel normal (deg)
              solar_constant: Solar flux at 1 AU (W/m^2)

          Returns:
              Generated power (W), or None (with a warning) if sun_distance is 0
          )doc");
}
