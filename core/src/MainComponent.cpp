// MainComponent construction, timer and keyboard handling; rendering and
// pointer input live in the split translation units:
//  - MainComponent_Paint.cpp
//  - MainComponent_Input.cpp

#include "MainComponent.h"

#include <string>

#include "MainComponentHelpers.h"

MainComponent::MainComponent(const softblob::ui::AppOptions& options)
{
    setSize(1280, 720);
    setOpaque(true);
    setWantsKeyboardFocus(true);

    std::string error;
    if (!softblob::InitialiseSession(session_, options.config,
                                     options.toggles, &error)) {
        // Options are validated before the window exists; an empty
        // session only means nothing gets drawn.
        juce::Logger::writeToLog(
            juce::String("[softblob] Failed to build shape: ") +
            juce::String(error));
    }

    startTimerHz(kFramesPerSecond);
}

void MainComponent::resized()
{
    repaint();
}

void MainComponent::timerCallback()
{
    const auto result = softblob::AdvanceFrame(session_);
    if (result.rotation_reversed) {
        juce::Logger::writeToLog("[softblob] reversing rotation");
    }

    repaint();
}

bool MainComponent::keyPressed(const juce::KeyPress& key)
{
    const auto action = softblob::ui::toggleActionForKey(key);
    if (!action.has_value()) {
        return false;
    }

    applyToggle(*action);
    return true;
}

void MainComponent::applyToggle(const softblob::ToggleAction action)
{
    const auto& toggles = softblob::ApplyToggle(session_, action);

    bool enabled = false;
    switch (action) {
        case softblob::ToggleAction::kOverlays:
            enabled = toggles.show_markers;
            break;
        case softblob::ToggleAction::kAnimate:
            enabled = toggles.animating;
            break;
        case softblob::ToggleAction::kFill:
            enabled = toggles.filled;
            break;
        case softblob::ToggleAction::kRotate:
            enabled = toggles.rotating;
            break;
    }

    juce::Logger::writeToLog(
        juce::String("[softblob] ") +
        softblob::ToggleActionName(action) + (enabled ? ": on" : ": off"));
    repaint();
}
