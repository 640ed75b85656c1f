// SFM CNC - Unit Table and Parsing Tests

#include <gtest/gtest.h>

#include "sfm-cnc/units.h"

using namespace sfm::cnc;

// ============================================================================
// Unit lookup
// ============================================================================

TEST(Units, FindBySymbol) {
    ASSERT_NE(units::findUnit("in"), nullptr);
    EXPECT_EQ(*units::findUnit("in"), units::inch());
    EXPECT_EQ(*units::findUnit("ft/min"), units::footPerMinute());
    EXPECT_EQ(*units::findUnit("hp/(in^3/min)"), units::horsepowerPerCubicInchPerMinute());
}

TEST(Units, FindByAlias) {
    EXPECT_EQ(*units::findUnit("sfm"), units::footPerMinute());
    EXPECT_EQ(*units::findUnit("ipm"), units::inchPerMinute());
    EXPECT_EQ(*units::findUnit("RPM"), units::revolutionPerMinute());
    EXPECT_EQ(*units::findUnit("inches"), units::inch());
}

TEST(Units, FindIgnoresWhitespace) {
    ASSERT_NE(units::findUnit(" hp / (in^3 / min) "), nullptr);
    EXPECT_EQ(*units::findUnit(" hp / (in^3 / min) "), units::horsepowerPerCubicInchPerMinute());
}

TEST(Units, UnknownSymbol) {
    EXPECT_EQ(units::findUnit("furlong"), nullptr);
}

TEST(Units, UnitPowerConversions) {
    // 1 hp/(in^3/min) is about 2.73 W/(mm^3/s)
    Quantity k(1.0, units::horsepowerPerCubicInchPerMinute());
    EXPECT_NEAR(k.in(units::wattPerCubicMillimeterPerSecond()), 2.7304, 1e-3);
    EXPECT_NEAR(k.in(units::kilowattPerCubicCentimeterPerMinute()), 0.04551, 1e-4);
}

// ============================================================================
// Quantity parsing
// ============================================================================

TEST(UnitsParse, NumberAndUnit) {
    Quantity q;
    ASSERT_TRUE(units::parseQuantity("3 hp", q));
    EXPECT_DOUBLE_EQ(q.magnitude(), 3.0);
    EXPECT_EQ(q.unit(), units::horsepower());

    ASSERT_TRUE(units::parseQuantity("  0.4 hp/(in^3/min)  ", q));
    EXPECT_DOUBLE_EQ(q.magnitude(), 0.4);
    EXPECT_EQ(q.dimension(), Dimension::powerDensity());
}

TEST(UnitsParse, NoSpaceBeforeUnit) {
    Quantity q;
    ASSERT_TRUE(units::parseQuantity("12.7mm", q));
    EXPECT_NEAR(q.in(units::inch()), 0.5, 1e-12);
}

TEST(UnitsParse, BareNumberIsDimensionless) {
    Quantity q;
    ASSERT_TRUE(units::parseQuantity("0.005", q));
    EXPECT_TRUE(q.isDimensionless());
    EXPECT_DOUBLE_EQ(q.magnitude(), 0.005);
}

TEST(UnitsParse, Failures) {
    Quantity q;
    std::string error;

    EXPECT_FALSE(units::parseQuantity("", q, &error));
    EXPECT_FALSE(error.empty());

    EXPECT_FALSE(units::parseQuantity("fast", q, &error));
    EXPECT_NE(error.find("number"), std::string::npos);

    EXPECT_FALSE(units::parseQuantity("3 furlongs", q, &error));
    EXPECT_NE(error.find("furlongs"), std::string::npos);

    EXPECT_FALSE(units::parseQuantity("inf in", q, &error));
}

TEST(UnitsParse, ListSharesTrailingUnit) {
    std::vector<Quantity> speeds;
    ASSERT_TRUE(units::parseQuantityList("80, 135, 210 rpm", speeds));
    ASSERT_EQ(speeds.size(), 3u);
    for (const auto& speed : speeds) {
        EXPECT_EQ(speed.unit(), units::revolutionPerMinute());
    }
    EXPECT_DOUBLE_EQ(speeds[0].magnitude(), 80.0);
    EXPECT_DOUBLE_EQ(speeds[2].magnitude(), 210.0);
}

TEST(UnitsParse, ListKeepsExplicitUnits) {
    std::vector<Quantity> speeds;
    ASSERT_TRUE(units::parseQuantityList("100 rpm, 20 rad/s", speeds));
    ASSERT_EQ(speeds.size(), 2u);
    EXPECT_EQ(speeds[0].unit(), units::revolutionPerMinute());
    EXPECT_EQ(speeds[1].unit(), units::radianPerSecond());
}

TEST(UnitsParse, ListFailure) {
    std::vector<Quantity> speeds;
    std::string error;
    EXPECT_FALSE(units::parseQuantityList("80, , 210 rpm", speeds, &error));
    EXPECT_FALSE(error.empty());
}
