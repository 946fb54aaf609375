#pragma once

#include <juce_gui_extra/juce_gui_extra.h>

#include "AppOptions.h"
#include "InteractionSystem.h"
#include "core/BlobSession.h"

class MainComponent : public juce::Component, public juce::Timer {
public:
    // `options` must already have passed ParseAppOptions, so building
    // the session cannot fail here.
    explicit MainComponent(const softblob::ui::AppOptions& options);
    ~MainComponent() override = default;

    void paint(juce::Graphics& g) override;
    void resized() override;

    void mouseDown(const juce::MouseEvent& event) override;
    void mouseDrag(const juce::MouseEvent& event) override;
    void mouseUp(const juce::MouseEvent& event) override;

    bool keyPressed(const juce::KeyPress& key) override;

    void timerCallback() override;

private:
    void paintOutline(juce::Graphics& g) const;
    void paintConnectors(juce::Graphics& g) const;
    void paintMarkers(juce::Graphics& g) const;

    void applyToggle(softblob::ToggleAction action);

    softblob::BlobSession session_;
    softblob::ui::InteractionSystem interaction_{session_};

    static constexpr int kFramesPerSecond = 60;
    static constexpr float kOutlineThickness = 2.0F;
    static constexpr float kConnectorThickness = 5.0F;

    // Gradient axis for the filled rendering, in shape space.
    static constexpr float kFillGradientExtent = 400.0F;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainComponent)
};
