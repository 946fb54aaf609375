#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "core/BlobShape.h"
#include "core/MathUtils.h"
#include "core/ShapeConfig.h"

namespace softblob {

// Named user toggles forwarded by the input layer.
enum class ToggleAction {
  kOverlays = 0,  // markers and connector lines together
  kAnimate,
  kFill,
  kRotate,
};

[[nodiscard]] const char* ToggleActionName(ToggleAction action);

struct DisplayToggles {
  bool show_markers{true};
  bool show_connectors{true};
  bool animating{false};
  bool filled{false};
  bool rotating{false};

  [[nodiscard]] bool operator==(const DisplayToggles& other) const {
    return show_markers == other.show_markers &&
           show_connectors == other.show_connectors &&
           animating == other.animating && filled == other.filled &&
           rotating == other.rotating;
  }

  [[nodiscard]] bool operator!=(const DisplayToggles& other) const {
    return !(*this == other);
  }
};

// What happened during one AdvanceFrame call, for logging.
struct FrameTickResult {
  bool rotation_reversed{false};
  std::size_t sweeps_reversed{0};
};

// All mutable state of one running blob: the shape, the random source
// driving it, the toggles and the current drag capture. Ticks and
// pointer events are applied to it from a single thread.
struct BlobSession {
  ShapeConfig config;
  BlobShape shape;
  RandomSource random;
  DisplayToggles toggles;

  double rotation_radians{0.0};
  SweepDirection rotation_direction{SweepDirection::kForward};

  std::optional<ControlPointIndex> captured;
};

// Builds the shape for `config` into `session`, seeding the random
// source from config.random_seed (clock when 0). All-or-nothing: on an
// invalid configuration `session` is unchanged.
bool InitialiseSession(BlobSession& session, const ShapeConfig& config,
                       const DisplayToggles& toggles = DisplayToggles{},
                       std::string* error = nullptr);

// One animation frame: rotation step (when rotating) then one
// oscillation tick (when animating).
FrameTickResult AdvanceFrame(BlobSession& session);

// Flips the state named by `action`. Returns the toggles afterwards.
const DisplayToggles& ApplyToggle(BlobSession& session, ToggleAction action);

// Hit-tests `shape_point` (shape-centred coordinates) against the
// control points and captures the first match. Ignored while another
// point is captured. Returns the captured index, if any.
std::optional<ControlPointIndex> BeginCapture(BlobSession& session,
                                              const Vec2& shape_point);

// Moves the captured control point to `shape_point`. Returns false when
// nothing is captured.
bool UpdateCapture(BlobSession& session, const Vec2& shape_point);

// Releases the capture. Returns false when nothing was captured.
bool EndCapture(BlobSession& session);

}  // namespace softblob
