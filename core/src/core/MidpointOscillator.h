#pragma once

#include "core/BlobShape.h"
#include "core/MathUtils.h"

namespace softblob {

// Per-anchor sweep state machine. Moves the anchor's two paired control
// points by the same angle (speed * step_scale * direction) so the join
// between the incoming and outgoing curve stays smooth. The offset from
// the base angle is kept within [-max_sweep, +max_sweep]; on reaching a
// bound the direction flips and a fresh speed in [0, 1) is drawn.
//
// Only angles are touched; callers re-derive positions afterwards.
// Returns true when the direction flipped.
bool AdvanceSweep(AnchorPoint& anchor, ControlPoint& incoming,
                  ControlPoint& outgoing, const OscillationParams& params,
                  RandomSource& random);

}  // namespace softblob
