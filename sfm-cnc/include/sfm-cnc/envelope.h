#ifndef SFM_CNC_ENVELOPE_H
#define SFM_CNC_ENVELOPE_H

#include "sfm-cnc/machine.h"
#include "sfm-cnc/quantity.h"

namespace sfm {
namespace cnc {

/**
 * Nearest spindle speed the machine can actually run.
 *
 * Variable spindles clamp down to their ceiling and never clamp up.
 * Stepped spindles return the step closest to the ideal speed; when two
 * steps are equally close the one listed first wins.
 *
 * @param idealSpeed The angular velocity the cut asks for
 * @param range The machine's spindle range
 * @return The achievable angular velocity
 */
Quantity resolveSpindleSpeed(const Quantity& idealSpeed, const SpindleRange& range);

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_ENVELOPE_H
