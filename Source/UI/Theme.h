#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

namespace hexglow {
namespace Theme {

    // Window
    inline constexpr int DefaultWindowW = 1200;
    inline constexpr int DefaultWindowH = 720;
    inline constexpr int MinWindowW     = 320;
    inline constexpr int MinWindowH     = 240;

    // Config lookup when no path is given on the command line
    inline constexpr const char* ConfigDirName  = ".hexglow";
    inline constexpr const char* ConfigFileName = "config.json";

    namespace Colors {
        inline const juce::Colour WindowBg {0xffe8e8e8};
    }

} // namespace Theme
} // namespace hexglow
