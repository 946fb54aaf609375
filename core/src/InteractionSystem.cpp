#include "InteractionSystem.h"

#include "MainComponentHelpers.h"

namespace softblob::ui {

InteractionSystem::InteractionSystem(softblob::BlobSession& session) noexcept
    : session_(session)
{
}

std::optional<softblob::ControlPointIndex>
InteractionSystem::handlePointerDown(const PointerEvent& event,
                                     const juce::Rectangle<float>& bounds)
{
    if (!event.isPrimary) {
        return std::nullopt;
    }

    const auto shapePoint =
        screenToShape(event.position, bounds, session_.rotation_radians);
    return softblob::BeginCapture(session_, shapePoint);
}

bool InteractionSystem::handlePointerDrag(const PointerEvent& event,
                                          const juce::Rectangle<float>& bounds)
{
    if (!event.isPrimary || !isCapturing()) {
        return false;
    }

    const auto shapePoint =
        screenToShape(event.position, bounds, session_.rotation_radians);
    return softblob::UpdateCapture(session_, shapePoint);
}

bool InteractionSystem::handlePointerUp()
{
    return softblob::EndCapture(session_);
}

}  // namespace softblob::ui
