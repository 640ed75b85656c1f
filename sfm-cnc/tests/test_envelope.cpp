// SFM CNC - Spindle Range and Envelope Resolver Tests

#include <gtest/gtest.h>

#include "sfm-cnc/envelope.h"
#include "sfm-cnc/errors.h"
#include "sfm-cnc/units.h"

#include <cmath>

using namespace sfm::cnc;

namespace {

Quantity rpm(double value) {
    return Quantity(value, units::revolutionPerMinute());
}

std::vector<Quantity> bridgeportSteps() {
    std::vector<Quantity> steps;
    for (double s : {80.0, 135.0, 210.0, 325.0, 660.0, 1115.0, 1750.0, 2720.0}) {
        steps.push_back(rpm(s));
    }
    return steps;
}

} // namespace

// ============================================================================
// Spindle range construction
// ============================================================================

TEST(SpindleRange, Variable) {
    SpindleRange range = SpindleRange::variable(rpm(3000));
    EXPECT_EQ(range.getControl(), SpindleControl::VARIABLE);
    EXPECT_FALSE(range.isStepped());
    EXPECT_DOUBLE_EQ(range.getMaxSpeed().magnitude(), 3000.0);
    EXPECT_TRUE(range.getSpeeds().empty());
}

TEST(SpindleRange, SteppedKeepsOrderAndFindsMax) {
    std::vector<Quantity> steps = {rpm(660), rpm(2720), rpm(80)};
    SpindleRange range = SpindleRange::stepped(steps);
    EXPECT_TRUE(range.isStepped());
    ASSERT_EQ(range.getSpeeds().size(), 3u);
    EXPECT_DOUBLE_EQ(range.getSpeeds()[0].magnitude(), 660.0);
    EXPECT_DOUBLE_EQ(range.getMaxSpeed().magnitude(), 2720.0);
}

TEST(SpindleRange, RejectsEmptyList) {
    EXPECT_THROW(SpindleRange::stepped(std::vector<Quantity>()), InvalidMachineSpec);
}

TEST(SpindleRange, RejectsNonPositiveSpeeds) {
    EXPECT_THROW(SpindleRange::variable(rpm(0)), InvalidMachineSpec);
    EXPECT_THROW(SpindleRange::variable(rpm(-100)), InvalidMachineSpec);
    EXPECT_THROW(SpindleRange::stepped({rpm(100), rpm(0)}), InvalidMachineSpec);
}

TEST(SpindleRange, RejectsWrongDimension) {
    EXPECT_THROW(SpindleRange::variable(Quantity(3000, units::inchPerMinute())), DimensionMismatch);
    EXPECT_THROW(SpindleRange::stepped({rpm(100), Quantity(1, units::inch())}), DimensionMismatch);
}

// ============================================================================
// Variable spindle
// ============================================================================

TEST(Envelope, VariableBelowCeilingUnchanged) {
    SpindleRange range = SpindleRange::variable(rpm(3000));
    Quantity resolved = resolveSpindleSpeed(rpm(1527.9), range);
    EXPECT_DOUBLE_EQ(resolved.in(units::revolutionPerMinute()), 1527.9);
}

TEST(Envelope, VariableClampsToCeiling) {
    SpindleRange range = SpindleRange::variable(rpm(3000));
    Quantity resolved = resolveSpindleSpeed(rpm(6112), range);
    EXPECT_DOUBLE_EQ(resolved.in(units::revolutionPerMinute()), 3000.0);
}

TEST(Envelope, VariableNeverRaisesSpeed) {
    SpindleRange range = SpindleRange::variable(rpm(3000));
    for (double ideal : {1.0, 50.0, 999.0, 2999.9, 3000.0, 3000.1, 10000.0}) {
        Quantity resolved = resolveSpindleSpeed(rpm(ideal), range);
        EXPECT_LE(resolved.in(units::revolutionPerMinute()), 3000.0);
        EXPECT_LE(resolved.in(units::revolutionPerMinute()), ideal);
    }
}

TEST(Envelope, VariableAcceptsOtherUnits) {
    SpindleRange range = SpindleRange::variable(rpm(3000));
    Quantity resolved = resolveSpindleSpeed(Quantity(1000.0, units::radianPerSecond()), range);
    EXPECT_NEAR(resolved.in(units::revolutionPerMinute()), 3000.0, 1e-9);
}

// ============================================================================
// Stepped spindle
// ============================================================================

TEST(Envelope, SteppedPicksNearest) {
    SpindleRange range = SpindleRange::stepped(bridgeportSteps());
    EXPECT_DOUBLE_EQ(resolveSpindleSpeed(rpm(1527.9), range).magnitude(), 1750.0);
    EXPECT_DOUBLE_EQ(resolveSpindleSpeed(rpm(500), range).magnitude(), 660.0);
    EXPECT_DOUBLE_EQ(resolveSpindleSpeed(rpm(10), range).magnitude(), 80.0);
    EXPECT_DOUBLE_EQ(resolveSpindleSpeed(rpm(9000), range).magnitude(), 2720.0);
}

TEST(Envelope, SteppedResultIsAStepWithNoCloserStep) {
    std::vector<Quantity> steps = bridgeportSteps();
    SpindleRange range = SpindleRange::stepped(steps);

    for (double ideal = 10.0; ideal < 4000.0; ideal += 37.0) {
        Quantity resolved = resolveSpindleSpeed(rpm(ideal), range);
        double distance = std::abs(resolved.magnitude() - ideal);

        bool isStep = false;
        for (const auto& step : steps) {
            if (step == resolved) {
                isStep = true;
            }
            EXPECT_GE(std::abs(step.magnitude() - ideal), distance);
        }
        EXPECT_TRUE(isStep) << ideal;
    }
}

TEST(Envelope, SteppedTieGoesToFirstListed) {
    SpindleRange ascending = SpindleRange::stepped({rpm(100), rpm(200)});
    EXPECT_DOUBLE_EQ(resolveSpindleSpeed(rpm(150), ascending).magnitude(), 100.0);

    SpindleRange descending = SpindleRange::stepped({rpm(200), rpm(100)});
    EXPECT_DOUBLE_EQ(resolveSpindleSpeed(rpm(150), descending).magnitude(), 200.0);
}

TEST(Envelope, SingleStep) {
    SpindleRange range = SpindleRange::stepped({rpm(1200)});
    EXPECT_DOUBLE_EQ(resolveSpindleSpeed(rpm(10), range).magnitude(), 1200.0);
}
