#ifndef SFM_CNC_CALCULATOR_H
#define SFM_CNC_CALCULATOR_H

#include "sfm-cnc/machine.h"
#include "sfm-cnc/quantity.h"
#include "sfm-cnc/tooling.h"
#include <vector>

namespace sfm {
namespace cnc {

/**
 * Constants that shape the recommendation. None of them is physics; they
 * all come from the caller (normally the configuration file).
 */
struct CalculatorSettings {
    ToolMaterialTable surfaceSpeedMultipliers;  // Tool material class -> SFM multiplier
    double chipLoad = 0.0;                      // Advance per tooth per rev, as a fraction of diameter
    double powerMargin = 0.0;                   // Fraction of rated power to plan for (0, 1]
    double efficiency = 0.0;                    // Fraction of motor power reaching the tool (0, 1]
};

/**
 * One point of the stepover curve
 */
struct StepoverSample {
    Quantity axialDepth;            // Axial depth of cut
    Quantity radialDepth;           // Radial depth of cut the power budget allows
    double stepoverPercent;         // Radial depth as a percentage of tool diameter

    StepoverSample() : stepoverPercent(0.0) {}
};

/**
 * Recommendation for one (machine, tool, material) triple
 */
struct CuttingResult {
    Quantity surfaceSpeed;          // Effective surface speed for this tool material
    Quantity idealSpindleSpeed;     // Speed the surface speed asks for
    Quantity spindleSpeed;          // Speed the machine can actually run
    Quantity feedRate;              // Feed after clamping to the machine limit
    Quantity targetPower;           // Spindle power to plan for
    Quantity removalRate;           // Material removal rate budget
    std::vector<StepoverSample> samples;  // Ascending axial depth
    size_t skippedSamples = 0;      // Requested depths dropped as undefined (<= 0 or not finite)
    bool speedResolved = false;     // Spindle speed differs from the ideal speed
    bool feedLimited = false;       // Feed was clamped to the machine maximum
};

/**
 * Derives spindle speed, feed and the stepover curve from a machine's
 * power budget. Stateless apart from its settings; safe to share.
 */
class CuttingCalculator {
public:
    /**
     * @param settings Chip load, power margin, efficiency and multipliers
     * @throws InvalidCalculatorSettings if a constant is out of range
     */
    explicit CuttingCalculator(const CalculatorSettings& settings);

    const CalculatorSettings& getSettings() const { return m_settings; }

    /**
     * Validate the inputs and compute the recommendation
     * @param machine The machine running the cut
     * @param tool The end mill
     * @param material The work material
     * @param axialDepths Candidate axial depths of cut (lengths, any order)
     * @return The cutting result, samples sorted by ascending depth
     * @throws DimensionMismatch, InvalidToolGeometry, InvalidMaterialSpec,
     *         InvalidMachineSpec, UnknownToolMaterial
     */
    CuttingResult calculate(const Machine& machine, const Tool& tool,
                            const WorkMaterial& material,
                            const std::vector<Quantity>& axialDepths) const;

    // Same as above without stepover samples
    CuttingResult calculate(const Machine& machine, const Tool& tool,
                            const WorkMaterial& material) const;

    // Material surface speed scaled by the tool material multiplier
    Quantity effectiveSurfaceSpeed(const Tool& tool, const WorkMaterial& material) const;

    // Surface speed / (pi * diameter / rev), in rpm
    Quantity idealSpindleSpeed(const Tool& tool, const WorkMaterial& material) const;

    // Chip load * diameter * speed * teeth/rev, clamped to the machine limit, in in/min
    Quantity feedRate(const Machine& machine, const Tool& tool, const Quantity& spindleSpeed) const;

    // Rated power * margin * efficiency
    Quantity targetPower(const Machine& machine) const;

    // Target power / specific cutting power, in in^3/min
    Quantity removalRate(const Machine& machine, const WorkMaterial& material) const;

    /**
     * Radial depth and stepover for each usable axial depth
     * @param removalRate Removal rate budget (volumetric flow rate)
     * @param feedRate Feed rate (velocity)
     * @param toolDiameter Tool diameter (length)
     * @param axialDepths Candidate depths; zero, negative and non-finite ones are dropped
     * @param skipped Optional output for the number of dropped depths
     * @return Samples in ascending depth order
     */
    static std::vector<StepoverSample> stepoverCurve(const Quantity& removalRate,
                                                     const Quantity& feedRate,
                                                     const Quantity& toolDiameter,
                                                     const std::vector<Quantity>& axialDepths,
                                                     size_t* skipped = nullptr);

private:
    CalculatorSettings m_settings;

    void validateSettings() const;
};

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_CALCULATOR_H
