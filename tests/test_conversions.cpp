#include "nomaiq_conversions.h"
#include "nomaiq_types.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>

namespace
{

using namespace phicore::nomaiq;

class TestConversions : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestConversions, brightness_scales_between_percent_and_byte)
{
    EXPECT_EQ(brightnessToExposed(0), 0);
    EXPECT_EQ(brightnessToExposed(100), 255);
    EXPECT_EQ(brightnessToExposed(50), 128);
    EXPECT_EQ(brightnessFromExposed(0), 0);
    EXPECT_EQ(brightnessFromExposed(255), 100);
    EXPECT_EQ(brightnessFromExposed(128), 50);
}

TEST_F(TestConversions, brightness_round_trip_stays_within_one_step)
{
    EXPECT_EQ(brightnessToExposed(brightnessFromExposed(255)), 255);
    for (int exposed = 0; exposed <= 255; ++exposed) {
        const int back = brightnessToExposed(brightnessFromExposed(exposed));
        EXPECT_LE(std::abs(back - exposed), 2) << "exposed " << exposed;
    }
    for (int device = 0; device <= 100; ++device)
        EXPECT_EQ(brightnessFromExposed(brightnessToExposed(device)), device);
}

TEST_F(TestConversions, color_temperature_maps_coolest_to_min_mired)
{
    EXPECT_EQ(colorTempToMired(100), kMinMired);
    EXPECT_EQ(colorTempToMired(0), kMaxMired);
    EXPECT_EQ(colorTempFromMired(kMinMired), 100);
    EXPECT_EQ(colorTempFromMired(kMaxMired), 0);

    EXPECT_EQ(colorTempToMired(colorTempFromMired(153)), 153);
    EXPECT_EQ(colorTempToMired(colorTempFromMired(500)), 500);
}

TEST_F(TestConversions, color_temperature_clamps_out_of_range_mireds)
{
    EXPECT_EQ(colorTempFromMired(100), 100);
    EXPECT_EQ(colorTempFromMired(600), 0);
}

TEST_F(TestConversions, hue_wraps_into_one_turn)
{
    EXPECT_DOUBLE_EQ(normalizeHue(0.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeHue(360.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeHue(400.0), 40.0);
    EXPECT_DOUBLE_EQ(normalizeHue(-30.0), 330.0);
}

TEST_F(TestConversions, property_values_compare_bool_and_int_as_switch_state)
{
    EXPECT_TRUE(propertyMatches(PropertyValue(std::int64_t(1)), PropertyValue(true)));
    EXPECT_TRUE(propertyMatches(PropertyValue(false), PropertyValue(std::int64_t(0))));
    EXPECT_FALSE(propertyMatches(PropertyValue(std::int64_t(0)), PropertyValue(std::int64_t(1))));
    EXPECT_FALSE(propertyMatches(PropertyValue(QStringLiteral("1")), PropertyValue(std::int64_t(1))));
    EXPECT_TRUE(propertyMatches(PropertyValue(QStringLiteral("opened")), PropertyValue(QStringLiteral("opened"))));
}

TEST_F(TestConversions, property_accessors_coerce_ayla_values)
{
    EXPECT_EQ(propertyAsBool(PropertyValue(std::int64_t(1))), true);
    EXPECT_EQ(propertyAsBool(PropertyValue(QStringLiteral("off"))), false);
    EXPECT_FALSE(propertyAsBool(PropertyValue(QStringLiteral("maybe"))).has_value());
    EXPECT_EQ(propertyAsInt(PropertyValue(QStringLiteral(" 42 "))), 42);
    EXPECT_EQ(propertyAsInt(PropertyValue(true)), 1);
    EXPECT_FALSE(propertyAsString(PropertyValue(std::int64_t(3))).has_value());
    EXPECT_FALSE(propertyAsInt(std::nullopt).has_value());
}

} // namespace
