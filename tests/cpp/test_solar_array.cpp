/**
 * @file test_solar_array.cpp
 * @brief Unit tests for solar array power generation
 */

#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>
#include "core/diagnostics.hpp"
#include "models/solar_array.hpp"

namespace spacecraft::models {
namespace {

// Test fixture capturing warnings instead of printing them
class SolarArrayTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_handler = core::set_warning_handler(
            [this](const std::string& line) { warnings.push_back(line); });
        core::set_warnings_enabled(true);
    }

    void TearDown() override { core::set_warning_handler(previous_handler); }

    std::vector<std::string> warnings;
    core::WarningHandler previous_handler;
};

// ============== Parameter Tests ==============

TEST_F(SolarArrayTest, ParametersDefaultConstruction) {
    SolarArrayParameters params;
    EXPECT_DOUBLE_EQ(params.effective_area, 1.0);
    EXPECT_DOUBLE_EQ(params.efficiency, 0.28);
    EXPECT_DOUBLE_EQ(params.incidence_angle, 0.0);
    EXPECT_DOUBLE_EQ(params.solar_constant, 1366.0);
}

TEST_F(SolarArrayTest, ParametersValidation) {
    EXPECT_TRUE(SolarArrayParameters(2.0, 0.3).is_valid());

    SolarArrayParameters negative_area(-1.0);
    EXPECT_FALSE(negative_area.is_valid());
    EXPECT_THROW(negative_area.validate(), std::invalid_argument);

    SolarArrayParameters bad_efficiency(1.0, 1.2);
    EXPECT_FALSE(bad_efficiency.is_valid());
    EXPECT_THROW(bad_efficiency.validate(), std::invalid_argument);

    SolarArrayParameters bad_flux(1.0, 0.28, 0.0, 0.0);
    EXPECT_FALSE(bad_flux.is_valid());
    EXPECT_THROW(bad_flux.validate(), std::invalid_argument);
}

TEST_F(SolarArrayTest, ParametersToString) {
    std::string str = SolarArrayParameters().to_string();
    EXPECT_NE(str.find("effective_area="), std::string::npos);
    EXPECT_NE(str.find("efficiency="), std::string::npos);
}

// ============== Solar Flux Tests ==============

TEST_F(SolarArrayTest, SolarFluxAtOneAU) {
    auto flux = solar_flux(1.0);
    ASSERT_TRUE(flux.has_value());
    EXPECT_DOUBLE_EQ(*flux, 1366.0);
}

TEST_F(SolarArrayTest, SolarFluxZeroDistanceIsSilent) {
    EXPECT_FALSE(solar_flux(0.0).has_value());
    EXPECT_TRUE(warnings.empty());
}

// ============== Power Tests ==============

TEST_F(SolarArrayTest, PowerNormalIncidenceUnitArray) {
    // S * A * eta * cos(0) at 1 AU = 1366 W
    auto power = solar_array_power(1.0, 1.0, 1.0, 0.0, 1366.0);
    ASSERT_TRUE(power.has_value());
    EXPECT_DOUBLE_EQ(*power, 1366.0);
}

TEST_F(SolarArrayTest, PowerGrazingIncidenceIsZero) {
    auto power = solar_array_power(1.0, 1.0, 1.0, 90.0, 1366.0);
    ASSERT_TRUE(power.has_value());
    EXPECT_NEAR(*power, 0.0, 1e-9);
}

TEST_F(SolarArrayTest, PowerDefaults) {
    // Defaults: efficiency 0.28, incidence 0, solar constant 1366
    auto power = solar_array_power(1.0, 2.0);
    ASSERT_TRUE(power.has_value());
    EXPECT_NEAR(*power, 1366.0 * 2.0 * 0.28, 1e-9);
}

TEST_F(SolarArrayTest, PowerCosineLaw) {
    auto power = solar_array_power(1.0, 2.0, 0.28, 30.0);
    ASSERT_TRUE(power.has_value());
    EXPECT_NEAR(*power, 1366.0 * 2.0 * 0.28 * std::sqrt(3.0) / 2.0, 1e-9);
}

TEST_F(SolarArrayTest, PowerInverseSquareLaw) {
    auto near = solar_array_power(1.0, 3.0, 0.3, 20.0);
    auto far = solar_array_power(2.0, 3.0, 0.3, 20.0);
    ASSERT_TRUE(near.has_value());
    ASSERT_TRUE(far.has_value());
    EXPECT_NEAR(*far, *near / 4.0, 1e-9);

    // Closer than 1 AU scales up the same way
    auto venus = solar_array_power(0.723, 3.0, 0.3, 20.0);
    ASSERT_TRUE(venus.has_value());
    EXPECT_NEAR(*venus, *near / (0.723 * 0.723), 1e-9);
}

TEST_F(SolarArrayTest, PowerBeyondNinetyDegreesIsNegative) {
    // Panel facing away from the Sun: not clamped
    auto power = solar_array_power(1.0, 1.0, 1.0, 180.0, 1366.0);
    ASSERT_TRUE(power.has_value());
    EXPECT_NEAR(*power, -1366.0, 1e-9);

    auto oblique = solar_array_power(1.0, 1.0, 1.0, 120.0, 1366.0);
    ASSERT_TRUE(oblique.has_value());
    EXPECT_LT(*oblique, 0.0);
}

TEST_F(SolarArrayTest, PowerAcceptsUnvalidatedInputs) {
    // Negative area and efficiency above one are computed, not rejected
    auto power = solar_array_power(1.0, -1.0, 1.5, 0.0, 1000.0);
    ASSERT_TRUE(power.has_value());
    EXPECT_NEAR(*power, -1500.0, 1e-9);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(SolarArrayTest, PowerZeroDistanceWarnsAndReturnsNothing) {
    auto power = solar_array_power(0.0, 1.0);
    EXPECT_FALSE(power.has_value());

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0],
              "[WARNING - solar_array_power] - Input value sun_distance cannot be 0.");
}

TEST_F(SolarArrayTest, PowerNegativeDistanceIsComputed) {
    // Only an exact zero is rejected; the square hides the sign
    auto power = solar_array_power(-1.0, 1.0, 1.0, 0.0, 1366.0);
    ASSERT_TRUE(power.has_value());
    EXPECT_DOUBLE_EQ(*power, 1366.0);
}

TEST_F(SolarArrayTest, PowerWithMutedWarnings) {
    core::set_warnings_enabled(false);
    EXPECT_FALSE(solar_array_power(0.0, 1.0).has_value());
    EXPECT_TRUE(warnings.empty());
    core::set_warnings_enabled(true);
}

// ============== SolarArray Model Tests ==============

TEST_F(SolarArrayTest, ModelMatchesFreeFunction) {
    SolarArrayParameters params(2.5, 0.3, 15.0, 1361.0);
    SolarArray array(params);

    auto expected = solar_array_power(1.5, 2.5, 0.3, 15.0, 1361.0);
    auto actual = array.power(1.5);
    ASSERT_TRUE(expected.has_value());
    ASSERT_TRUE(actual.has_value());
    EXPECT_DOUBLE_EQ(*actual, *expected);
}

TEST_F(SolarArrayTest, ModelPowerAtOverridesAngle) {
    SolarArray array(SolarArrayParameters(1.0, 1.0, 45.0, 1366.0));

    auto overridden = array.power_at(1.0, 0.0);
    ASSERT_TRUE(overridden.has_value());
    EXPECT_DOUBLE_EQ(*overridden, 1366.0);

    // Configured angle is unchanged
    EXPECT_DOUBLE_EQ(array.parameters().incidence_angle, 45.0);
}

TEST_F(SolarArrayTest, ModelSetParameters) {
    SolarArray array;
    array.set_parameters(SolarArrayParameters(4.0, 1.0));
    auto power = array.power(2.0);
    ASSERT_TRUE(power.has_value());
    EXPECT_DOUBLE_EQ(*power, 1366.0);
}

TEST_F(SolarArrayTest, PowerProfile) {
    SolarArray array(SolarArrayParameters(1.0, 1.0, 0.0, 1366.0));
    std::vector<double> distances = {0.5, 1.0, 0.0, 2.0};

    std::vector<double> powers = array.power_profile(distances);

    ASSERT_EQ(powers.size(), distances.size());
    EXPECT_NEAR(powers[0], 4.0 * 1366.0, 1e-9);
    EXPECT_NEAR(powers[1], 1366.0, 1e-9);
    EXPECT_TRUE(std::isnan(powers[2]));
    EXPECT_NEAR(powers[3], 1366.0 / 4.0, 1e-9);

    // One warning for the undefined entry
    EXPECT_EQ(warnings.size(), 1u);
}

TEST_F(SolarArrayTest, PowerProfileEmpty) {
    SolarArray array;
    std::vector<double> distances;
    EXPECT_TRUE(array.power_profile(distances).empty());
}

#ifdef SPACECRAFT_USE_EIGEN
TEST_F(SolarArrayTest, PowerProfileEigen) {
    SolarArray array(SolarArrayParameters(1.0, 1.0, 0.0, 1366.0));
    Eigen::VectorXd distances(3);
    distances << 1.0, 0.0, 2.0;

    Eigen::VectorXd powers = array.power_profile_eigen(distances);

    ASSERT_EQ(powers.size(), 3);
    EXPECT_NEAR(powers(0), 1366.0, 1e-9);
    EXPECT_TRUE(std::isnan(powers(1)));
    EXPECT_NEAR(powers(2), 1366.0 / 4.0, 1e-9);
    EXPECT_EQ(warnings.size(), 1u);
}
#endif

}  // namespace
}  // namespace spacecraft::models
