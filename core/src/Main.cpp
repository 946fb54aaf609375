#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <juce_gui_extra/juce_gui_extra.h>

#include "AppOptions.h"
#include "MainComponent.h"

class MainWindow : public juce::DocumentWindow {
public:
    MainWindow(juce::String name, const softblob::ui::AppOptions& options)
        : juce::DocumentWindow(name,
                               juce::Colours::white,
                               juce::DocumentWindow::allButtons)
    {
        setUsingNativeTitleBar(true);
        setResizable(true, true);
        setContentOwned(new MainComponent(options), true);
        centreWithSize(getWidth(), getHeight());
        setVisible(true);
    }

    void closeButtonPressed() override
    {
        juce::JUCEApplicationBase::quit();
    }

    bool keyPressed(const juce::KeyPress& key) override
    {
        // Escape closes the application.
        if (key.getKeyCode() == juce::KeyPress::escapeKey) {
            juce::JUCEApplicationBase::quit();
            return true;
        }

        const bool isAltEnter =
            key.getKeyCode() == juce::KeyPress::returnKey &&
            key.getModifiers().isAltDown();

        const bool isF11 =
            key.getKeyCode() == juce::KeyPress::F11Key;

        if (isAltEnter || isF11) {
            toggleFullscreen();
            return true;
        }

        return juce::DocumentWindow::keyPressed(key);
    }

private:
    void toggleFullscreen()
    {
        auto* peer = getPeer();
        if (peer == nullptr) {
            return;
        }

        if (!isInKioskMode_) {
            normalBounds_ = getBounds();
            setUsingNativeTitleBar(false);
            setTitleBarHeight(0);
            peer->setFullScreen(true);
            isInKioskMode_ = true;
        } else {
            peer->setFullScreen(false);
            setTitleBarHeight(24);
            setUsingNativeTitleBar(true);
            if (!normalBounds_.isEmpty()) {
                setBounds(normalBounds_);
            }
            isInKioskMode_ = false;
        }
    }

    bool isInKioskMode_{false};
    juce::Rectangle<int> normalBounds_{};
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainWindow)
};

class SoftBlobApplication : public juce::JUCEApplication {
public:
    SoftBlobApplication() = default;

    const juce::String getApplicationName() override { return "SoftBlob"; }
    const juce::String getApplicationVersion() override { return "0.1.0"; }

    void initialise(const juce::String& commandLineParameters) override
    {
        juce::ignoreUnused(commandLineParameters);

        // argparse expects the program name first.
        std::vector<std::string> arguments{"softblob"};
        for (const auto& token : getCommandLineParameterArray()) {
            arguments.push_back(token.toStdString());
        }

        softblob::ui::AppOptions options;
        std::string error;
        if (!softblob::ui::ParseAppOptions(arguments, options, &error)) {
            std::cerr << error << std::endl;
            setApplicationReturnValue(1);
            quit();
            return;
        }

        juce::Logger::writeToLog(
            juce::String("[softblob] Starting with ") +
            juce::String(softblob::ui::DescribeAppOptions(options)));

        mainWindow_ = std::make_unique<MainWindow>(getApplicationName(),
                                                   options);
    }

    void shutdown() override
    {
        mainWindow_.reset();
    }

private:
    std::unique_ptr<MainWindow> mainWindow_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SoftBlobApplication)
};

START_JUCE_APPLICATION(SoftBlobApplication)
