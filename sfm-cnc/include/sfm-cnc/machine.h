#ifndef SFM_CNC_MACHINE_H
#define SFM_CNC_MACHINE_H

#include "sfm-cnc/quantity.h"
#include <string>
#include <vector>

namespace sfm {
namespace cnc {

/**
 * Enum for the way a spindle's speed is selected
 */
enum class SpindleControl {
    VARIABLE,           // Any speed up to a ceiling (VFD, vari-speed head)
    STEPPED             // Fixed speeds only (belt or gear steps)
};

/**
 * The set of spindle speeds a machine can physically run.
 *
 * Build one with variable() or stepped(); both validate their input, so a
 * range obtained from them can always resolve a speed.
 */
class SpindleRange {
public:
    SpindleRange();

    /**
     * Continuously variable spindle
     * @param maxSpeed Highest achievable angular velocity
     * @throws DimensionMismatch if maxSpeed is not an angular velocity
     * @throws InvalidMachineSpec if maxSpeed is not positive
     */
    static SpindleRange variable(const Quantity& maxSpeed);

    /**
     * Stepped spindle
     * @param speeds Achievable angular velocities; the order given is the
     *        tie-break order when two steps are equally close
     * @throws DimensionMismatch if an entry is not an angular velocity
     * @throws InvalidMachineSpec if the list is empty or an entry is not positive
     */
    static SpindleRange stepped(const std::vector<Quantity>& speeds);

    SpindleControl getControl() const { return m_control; }
    bool isStepped() const { return m_control == SpindleControl::STEPPED; }

    // Ceiling for a variable spindle, fastest step for a stepped one
    const Quantity& getMaxSpeed() const { return m_maxSpeed; }

    // Steps in their defined order (empty for a variable spindle)
    const std::vector<Quantity>& getSpeeds() const { return m_speeds; }

private:
    SpindleControl m_control;
    Quantity m_maxSpeed;
    std::vector<Quantity> m_speeds;
};

/**
 * Machine reference data
 */
struct Machine {
    std::string name;
    Quantity ratedPower;            // Spindle motor rating (power)
    Quantity maxFeedRate;           // Fastest linear feed (velocity)
    SpindleRange spindle;

    Machine() = default;
    Machine(const std::string& name, const Quantity& ratedPower,
            const Quantity& maxFeedRate, const SpindleRange& spindle)
        : name(name), ratedPower(ratedPower), maxFeedRate(maxFeedRate), spindle(spindle) {}
};

/**
 * Check machine data
 * @throws DimensionMismatch if a quantity has the wrong dimension
 * @throws InvalidMachineSpec if power or feed is not positive or the spindle range is unset
 */
void validateMachine(const Machine& machine);

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_MACHINE_H
