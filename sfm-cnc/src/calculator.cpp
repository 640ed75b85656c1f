#include "sfm-cnc/calculator.h"
#include "sfm-cnc/envelope.h"
#include "sfm-cnc/errors.h"
#include "sfm-cnc/units.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace sfm {
namespace cnc {

namespace {

bool isFraction(double value) {
    return std::isfinite(value) && value > 0.0 && value <= 1.0;
}

// Chip load * diameter * speed * teeth/rev, before the machine limit
Quantity unclampedFeedRate(double chipLoad, const Tool& tool, const Quantity& spindleSpeed) {
    Quantity feed = chipLoad * tool.diameter * spindleSpeed * tool.getTeethPerRevolution();
    return feed.convertTo(units::inchPerMinute());
}

} // namespace

CuttingCalculator::CuttingCalculator(const CalculatorSettings& settings)
    : m_settings(settings) {
    validateSettings();
}

void CuttingCalculator::validateSettings() const {
    if (!std::isfinite(m_settings.chipLoad) || m_settings.chipLoad <= 0.0) {
        std::ostringstream ss;
        ss << "Chip load must be positive, got " << m_settings.chipLoad;
        throw InvalidCalculatorSettings(ss.str());
    }
    if (!isFraction(m_settings.powerMargin)) {
        std::ostringstream ss;
        ss << "Power margin must be in (0, 1], got " << m_settings.powerMargin;
        throw InvalidCalculatorSettings(ss.str());
    }
    if (!isFraction(m_settings.efficiency)) {
        std::ostringstream ss;
        ss << "Transmission efficiency must be in (0, 1], got " << m_settings.efficiency;
        throw InvalidCalculatorSettings(ss.str());
    }
    for (const auto& entry : m_settings.surfaceSpeedMultipliers) {
        if (!std::isfinite(entry.second) || entry.second <= 0.0) {
            std::ostringstream ss;
            ss << "Surface speed multiplier for '" << entry.first
               << "' must be positive, got " << entry.second;
            throw InvalidCalculatorSettings(ss.str());
        }
    }
}

Quantity CuttingCalculator::effectiveSurfaceSpeed(const Tool& tool,
                                                  const WorkMaterial& material) const {
    double multiplier = lookupSurfaceSpeedMultiplier(m_settings.surfaceSpeedMultipliers, tool);
    return material.surfaceSpeed * multiplier;
}

Quantity CuttingCalculator::idealSpindleSpeed(const Tool& tool,
                                              const WorkMaterial& material) const {
    // One revolution advances the cutting edge by the tool's circumference
    Quantity circumferencePerRev = M_PI * tool.diameter / Quantity(1.0, units::revolution());
    Quantity speed = effectiveSurfaceSpeed(tool, material) / circumferencePerRev;
    return speed.convertTo(units::revolutionPerMinute());
}

Quantity CuttingCalculator::feedRate(const Machine& machine, const Tool& tool,
                                     const Quantity& spindleSpeed) const {
    Quantity feed = unclampedFeedRate(m_settings.chipLoad, tool, spindleSpeed);
    if (feed > machine.maxFeedRate) {
        return machine.maxFeedRate.convertTo(units::inchPerMinute());
    }
    return feed;
}

Quantity CuttingCalculator::targetPower(const Machine& machine) const {
    return machine.ratedPower * m_settings.powerMargin * m_settings.efficiency;
}

Quantity CuttingCalculator::removalRate(const Machine& machine,
                                        const WorkMaterial& material) const {
    Quantity rate = targetPower(machine) / material.unitPower;
    return rate.convertTo(units::cubicInchPerMinute());
}

std::vector<StepoverSample> CuttingCalculator::stepoverCurve(const Quantity& removalRate,
                                                             const Quantity& feedRate,
                                                             const Quantity& toolDiameter,
                                                             const std::vector<Quantity>& axialDepths,
                                                             size_t* skipped) {
    requireDimension(removalRate, Dimension::volumetricFlowRate(), "Removal rate");
    requireDimension(feedRate, Dimension::velocity(), "Feed rate");
    requireDimension(toolDiameter, Dimension::lengthDim(), "Tool diameter");

    size_t dropped = 0;
    std::vector<Quantity> depths;
    depths.reserve(axialDepths.size());
    for (const auto& depth : axialDepths) {
        requireDimension(depth, Dimension::lengthDim(), "Axial depth of cut");
        if (!depth.isFinite() || depth.magnitude() <= 0.0) {
            dropped++;
            continue;
        }
        depths.push_back(depth);
    }

    std::stable_sort(depths.begin(), depths.end());

    std::vector<StepoverSample> samples;
    samples.reserve(depths.size());
    for (const auto& depth : depths) {
        Quantity radial = (removalRate / (feedRate * depth)).convertTo(depth.unit());
        double stepover = 100.0 * (radial / toolDiameter).in(units::dimensionless());
        if (!radial.isFinite() || !std::isfinite(stepover)) {
            dropped++;
            continue;
        }

        StepoverSample sample;
        sample.axialDepth = depth;
        sample.radialDepth = radial;
        sample.stepoverPercent = stepover;
        samples.push_back(sample);
    }

    if (skipped) {
        *skipped = dropped;
    }
    return samples;
}

CuttingResult CuttingCalculator::calculate(const Machine& machine, const Tool& tool,
                                           const WorkMaterial& material,
                                           const std::vector<Quantity>& axialDepths) const {
    // Reject malformed input before any computation
    validateMachine(machine);
    validateTool(tool);
    validateMaterial(material);
    lookupSurfaceSpeedMultiplier(m_settings.surfaceSpeedMultipliers, tool);

    CuttingResult result;
    result.surfaceSpeed = effectiveSurfaceSpeed(tool, material);
    result.idealSpindleSpeed = idealSpindleSpeed(tool, material);
    result.spindleSpeed = resolveSpindleSpeed(result.idealSpindleSpeed, machine.spindle);
    result.speedResolved = !result.spindleSpeed.approxEqual(result.idealSpindleSpeed);

    Quantity feed = unclampedFeedRate(m_settings.chipLoad, tool, result.spindleSpeed);
    result.feedRate = feedRate(machine, tool, result.spindleSpeed);
    result.feedLimited = feed > machine.maxFeedRate;

    result.targetPower = targetPower(machine);
    result.removalRate = removalRate(machine, material);

    result.samples = stepoverCurve(result.removalRate, result.feedRate, tool.diameter,
                                   axialDepths, &result.skippedSamples);
    return result;
}

CuttingResult CuttingCalculator::calculate(const Machine& machine, const Tool& tool,
                                           const WorkMaterial& material) const {
    return calculate(machine, tool, material, std::vector<Quantity>());
}

} // namespace cnc
} // namespace sfm
