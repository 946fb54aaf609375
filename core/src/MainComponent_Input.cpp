#include "MainComponent.h"

#include "MainComponentHelpers.h"

namespace {

softblob::ui::InteractionSystem::PointerEvent toPointerEvent(
    const juce::MouseEvent& event)
{
    softblob::ui::InteractionSystem::PointerEvent pointer;
    pointer.position = event.position;
    pointer.isPrimary = !event.mods.isRightButtonDown();
    return pointer;
}

}  // namespace

void MainComponent::mouseDown(const juce::MouseEvent& event)
{
    grabKeyboardFocus();

    const auto captured = interaction_.handlePointerDown(
        toPointerEvent(event), getLocalBounds().toFloat());
    if (captured.has_value()) {
        juce::Logger::writeToLog(
            juce::String("[softblob] captured control point ") +
            juce::String(static_cast<int>(*captured)));
        repaint();
    }
}

void MainComponent::mouseDrag(const juce::MouseEvent& event)
{
    if (interaction_.handlePointerDrag(toPointerEvent(event),
                                       getLocalBounds().toFloat())) {
        repaint();
    }
}

void MainComponent::mouseUp(const juce::MouseEvent& event)
{
    juce::ignoreUnused(event);

    if (interaction_.handlePointerUp()) {
        juce::Logger::writeToLog("[softblob] released control point");
        repaint();
    }
}
