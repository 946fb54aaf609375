#pragma once

#include <optional>

#include <juce_gui_basics/juce_gui_basics.h>

#include "core/BlobSession.h"

namespace softblob::ui {

// Thin adapter between JUCE pointer events and the session's capture
// model. Positions arrive in component pixels and are mapped into shape
// space (centre origin, current rotation undone) before they reach the
// core, so the core never sees JUCE types.
class InteractionSystem {
public:
    struct PointerEvent {
        juce::Point<float> position{};
        bool isPrimary{true};
    };

    explicit InteractionSystem(softblob::BlobSession& session) noexcept;

    // Returns the captured control point, if the press landed on one.
    std::optional<softblob::ControlPointIndex> handlePointerDown(
        const PointerEvent& event, const juce::Rectangle<float>& bounds);

    // Returns true when a captured point was moved.
    bool handlePointerDrag(const PointerEvent& event,
                           const juce::Rectangle<float>& bounds);

    // Returns true when a capture was released.
    bool handlePointerUp();

    [[nodiscard]] bool isCapturing() const noexcept
    {
        return session_.captured.has_value();
    }

private:
    softblob::BlobSession& session_;
};

}  // namespace softblob::ui
