#include <juce_gui_basics/juce_gui_basics.h>
#include "Model/EngineConfig.h"
#include "UI/HexBackgroundComponent.h"
#include "UI/Theme.h"

namespace hexglow {

// ============================================================
// Config resolution: argv path, then ~/.hexglow/config.json, then defaults
// ============================================================
static EngineConfig resolveConfig(const juce::StringArray& args)
{
    EngineConfig config;

    for (auto& arg : args) {
        if (arg.isEmpty() || arg.startsWith("-"))
            continue;
        auto file = juce::File::getCurrentWorkingDirectory().getChildFile(arg.unquoted());
        if (EngineConfig::loadFromFile(file, config)) {
            DBG("[app] Loaded config " + file.getFullPathName());
            return config;
        }
        DBG("[app] Could not load " + file.getFullPathName() + ", trying user config");
        break;
    }

    auto userFile = juce::File::getSpecialLocation(juce::File::userHomeDirectory)
                        .getChildFile(Theme::ConfigDirName)
                        .getChildFile(Theme::ConfigFileName);
    if (userFile.existsAsFile() && EngineConfig::loadFromFile(userFile, config)) {
        DBG("[app] Loaded config " + userFile.getFullPathName());
    }

    return config;
}

class MainWindow : public juce::DocumentWindow {
public:
    MainWindow(const juce::String& name, const EngineConfig& config)
        : DocumentWindow(name, Theme::Colors::WindowBg, DocumentWindow::allButtons)
    {
        setUsingNativeTitleBar(true);
        setContentOwned(new HexBackgroundComponent(config), false);
        setResizable(true, true);
        setResizeLimits(Theme::MinWindowW, Theme::MinWindowH, 10000, 10000);
        centreWithSize(Theme::DefaultWindowW, Theme::DefaultWindowH);
        setVisible(true);
    }

    void closeButtonPressed() override
    {
        juce::JUCEApplication::getInstance()->systemRequestedQuit();
    }

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainWindow)
};

class HexGlowApplication : public juce::JUCEApplication {
public:
    HexGlowApplication() = default;

    const juce::String getApplicationName() override    { return "HexGlow"; }
    const juce::String getApplicationVersion() override { return "1.0.0"; }
    bool moreThanOneInstanceAllowed() override          { return true; }

    void initialise(const juce::String&) override
    {
        auto config = resolveConfig(getCommandLineParameterArray());
        mainWindow_ = std::make_unique<MainWindow>(getApplicationName(), config);
    }

    void shutdown() override
    {
        mainWindow_.reset();
    }

    void systemRequestedQuit() override
    {
        quit();
    }

private:
    std::unique_ptr<MainWindow> mainWindow_;
};

} // namespace hexglow

START_JUCE_APPLICATION(hexglow::HexGlowApplication)
