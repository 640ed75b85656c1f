#include "sfm-cnc/machine.h"
#include "sfm-cnc/errors.h"
#include "sfm-cnc/units.h"

namespace sfm {
namespace cnc {

namespace {

void requirePositiveSpeed(const Quantity& speed) {
    requireDimension(speed, Dimension::angularVelocity(), "Spindle speed");
    if (!speed.isFinite() || speed.magnitude() <= 0.0) {
        throw InvalidMachineSpec("Spindle speed must be positive, got " + speed.toString());
    }
}

} // namespace

SpindleRange::SpindleRange()
    : m_control(SpindleControl::VARIABLE),
      m_maxSpeed(0.0, units::revolutionPerMinute()) {
}

SpindleRange SpindleRange::variable(const Quantity& maxSpeed) {
    requirePositiveSpeed(maxSpeed);

    SpindleRange range;
    range.m_control = SpindleControl::VARIABLE;
    range.m_maxSpeed = maxSpeed;
    return range;
}

SpindleRange SpindleRange::stepped(const std::vector<Quantity>& speeds) {
    if (speeds.empty()) {
        throw InvalidMachineSpec("A stepped spindle needs at least one speed");
    }

    SpindleRange range;
    range.m_control = SpindleControl::STEPPED;
    range.m_maxSpeed = speeds.front();
    for (const auto& speed : speeds) {
        requirePositiveSpeed(speed);
        if (speed > range.m_maxSpeed) {
            range.m_maxSpeed = speed;
        }
    }
    range.m_speeds = speeds;
    return range;
}

void validateMachine(const Machine& machine) {
    requireDimension(machine.ratedPower, Dimension::power(),
                     "Rated power of '" + machine.name + "'");
    requireDimension(machine.maxFeedRate, Dimension::velocity(),
                     "Maximum feed rate of '" + machine.name + "'");

    if (!machine.ratedPower.isFinite() || machine.ratedPower.magnitude() <= 0.0) {
        throw InvalidMachineSpec("Machine '" + machine.name +
                                 "': rated power must be positive, got " +
                                 machine.ratedPower.toString());
    }
    if (!machine.maxFeedRate.isFinite() || machine.maxFeedRate.magnitude() <= 0.0) {
        throw InvalidMachineSpec("Machine '" + machine.name +
                                 "': maximum feed rate must be positive, got " +
                                 machine.maxFeedRate.toString());
    }
    if (machine.spindle.getMaxSpeed().magnitude() <= 0.0) {
        throw InvalidMachineSpec("Machine '" + machine.name + "': spindle range is not set");
    }
}

} // namespace cnc
} // namespace sfm
