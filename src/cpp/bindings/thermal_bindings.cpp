/**
 * @file thermal_bindings.cpp
 * @brief pybind11 bindings for flat panel equilibrium temperature
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "models/panel_thermal.hpp"

namespace py = pybind11;
using namespace spacecraft::models;

void bind_panel_thermal(py::module_& m) {
    // ============== PanelThermalParameters struct ==============
    py::class_<PanelThermalParameters>(m, "PanelThermalParameters",
        R"doc(
        Panel surface properties.

        Attributes:
            absorptivity: Fraction of solar energy absorbed (1.0 = black body)
            emissivity: Infrared emission effectiveness
            solar_constant: Solar flux at 1 AU (W/m^2)
        )doc")
        .def(py::init<>(),
             "Construct with default parameters (absorptivity 0.85, emissivity 0.72)")
        .def(py::init<double, double, double>(),
             py::arg("absorptivity"),
             py::arg("emissivity"),
             py::arg("solar_constant") = spacecraft::core::SOLAR_CONSTANT_1AU)
        .def_readwrite("absorptivity", &PanelThermalParameters::absorptivity)
        .def_readwrite("emissivity", &PanelThermalParameters::emissivity)
        .def_readwrite("solar_constant", &PanelThermalParameters::solar_constant)
        .def("absorptance_ratio", &PanelThermalParameters::absorptance_ratio,
             "Absorptivity to emissivity ratio")
        .def("is_valid", &PanelThermalParameters::is_valid)
        .def("validate", &PanelThermalParameters::validate,
             "Validate parameters and raise ValueError if invalid")
        .def("__repr__", &PanelThermalParameters::to_string);

    // ============== PanelThermalModel class ==============
    py::class_<PanelThermalModel>(m, "PanelThermalModel",
        "Flat panel thermal model with fixed surface properties")
        .def(py::init<const PanelThermalParameters&>(),
             py::arg("params") = PanelThermalParameters())
        .def_property("parameters", &PanelThermalModel::parameters,
                      &PanelThermalModel::set_parameters)
        .def("kelvin", &PanelThermalModel::kelvin, py::arg("sun_distance"))
        .def("celsius", &PanelThermalModel::celsius, py::arg("sun_distance"))
        .def("legacy_temperature", &PanelThermalModel::legacy_temperature,
             py::arg("sun_distance"),
             "Legacy value T_K * 273.15 (not a Celsius temperature)")
        .def("temperature_profile", &PanelThermalModel::temperature_profile_eigen,
             py::arg("sun_distances"),
             "Kelvin temperatures for a NumPy array of distances, NaN where 0");

    m.def("equilibrium_temperature_kelvin", &equilibrium_temperature_kelvin,
          py::arg("sun_distance"),
          py::arg("absorptivity") = 0.85,
          py::arg("emissivity") = 0.72,
          py::arg("solar_constant") = spacecraft::core::SOLAR_CONSTANT_1AU,
          R"doc(
          Flat panel equilibrium steady-state temperature in Kelvin.

          T = (absorptivity * F / (2 * emissivity * sigma))^(1/4),  F = S / r^2

          Returns:
              Temperature (K), or None (with a warning) if sun_distance is 0
          )doc");

    m.def("equilibrium_temperature_celsius", &equilibrium_temperature_celsius,
          py::arg("sun_distance"),
          py::arg("absorptivity") = 0.85,
          py::arg("emissivity") = 0.72,
          py::arg("solar_constant") = spacecraft::core::SOLAR_CONSTANT_1AU,
          "Equilibrium temperature in degrees Celsius (T_K - 273.15)");

    m.def("panel_equilibrium_temperature", &panel_equilibrium_temperature,
          py::arg("sun_distance"),
          py::arg("absorptivity") = 0.85,
          py::arg("emissivity") = 0.72,
          py::arg("solar_constant") = spacecraft::core::SOLAR_CONSTANT_1AU,
          R"doc(
          Legacy panel temperature value.

          Returns T_K * 273.15, the value historically reported as
          "Celsius". This is not a temperature in any standard scale; use
          equilibrium_temperature_celsius for degrees Celsius.

          Returns:
              Legacy value, or None (with a warning) if sun_distance is 0
          )doc");
}
