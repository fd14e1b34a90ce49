/**
 * @file spacecraft_cpp.cpp
 * @brief Main pybind11 module combining all C++ bindings
 *
 * This creates the 'spacecraft_cpp' Python extension module exposing the
 * solar array power and panel thermal models.
 */

#include <pybind11/pybind11.h>

#include "core/constants.hpp"
#include "core/diagnostics.hpp"

namespace py = pybind11;

// Forward declarations of binding functions
void bind_solar_array(py::module_& m);
void bind_panel_thermal(py::module_& m);

/**
 * @brief Main Python module definition
 *
 * Creates submodules for each model category:
 * - power: solar array power generation
 * - thermal: flat panel equilibrium temperature
 */
PYBIND11_MODULE(spacecraft_cpp, m) {
    m.doc() = R"doc(
        Spacecraft Tools C++ Extension Module

        Closed-form spacecraft power and thermal formulas. Functions that
        cannot produce a value for their input (sun_distance == 0) print a
        warning and return None.

        Submodules:
            power: Solar array power generation
            thermal: Flat panel radiative equilibrium temperature

        Example:
            >>> from spacecraft_tools import spacecraft_cpp
            >>> # 2 m^2 array at 1 AU, 30 deg off-sun
            >>> spacecraft_cpp.power.solar_array_power(1.0, 2.0, incidence_angle=30.0)
            >>> # Panel temperature at Mars distance, Kelvin
            >>> spacecraft_cpp.thermal.equilibrium_temperature_kelvin(1.524)
    )doc";

    py::module_ power_module = m.def_submodule("power",
        R"doc(
        Solar array power generation.

        P = (1/r^2) * S * A * efficiency * cos(incidence)

        Classes:
            SolarArrayParameters: Array configuration
            SolarArray: Power evaluation for a fixed array
        )doc");

    py::module_ thermal_module = m.def_submodule("thermal",
        R"doc(
        Flat panel radiative equilibrium temperature.

        T = (absorptivity * F / (2 * emissivity * sigma))^(1/4)

        Classes:
            PanelThermalParameters: Surface properties
            PanelThermalModel: Temperature evaluation for a fixed panel
        )doc");

    bind_solar_array(power_module);
    bind_panel_thermal(thermal_module);

    py::module_ constants = m.def_submodule("constants", "Physical constants (SI units)");
    constants.attr("PI") = spacecraft::core::PI;
    constants.attr("STEFAN_BOLTZMANN") = spacecraft::core::STEFAN_BOLTZMANN;
    constants.attr("SOLAR_CONSTANT_1AU") = spacecraft::core::SOLAR_CONSTANT_1AU;
    constants.attr("ASTRONOMICAL_UNIT") = spacecraft::core::ASTRONOMICAL_UNIT;
    constants.attr("KELVIN_OFFSET") = spacecraft::core::KELVIN_OFFSET;

    m.def("set_warnings_enabled", &spacecraft::core::set_warnings_enabled,
          py::arg("enabled"),
          "Enable or disable warning output for invalid inputs");
    m.def("warnings_enabled", &spacecraft::core::warnings_enabled,
          "Whether warnings for invalid inputs are printed");

    // Add version information
    m.attr("__version__") = "0.1.0";
}
