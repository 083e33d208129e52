// rw_settings.h

#pragma once

#include "rw_sequencer.h"

#include <string>
#include <nlohmann/json.hpp>

namespace RW
{

struct Settings
{
    int volume = 100;
    bool muted = false;
    bool shuffle = false;
    RepeatMode repeatMode = RepeatMode::NoRepeat;
    std::string logLevel = "info";
    std::string logFile = "radarwhisper.log";
    std::string lastPlaylistDirectory;

    nlohmann::json ToJson() const;

    // Missing keys keep their defaults, unknown keys are ignored.
    static Settings FromJson(const nlohmann::json& data);

    // A missing or unreadable file yields the defaults.
    static Settings LoadFromFile(const std::string& filePath);
    bool SaveToFile(const std::string& filePath) const;
};

} // namespace RW
