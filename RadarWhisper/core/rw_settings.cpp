// rw_settings.cpp

#include "rw_settings.h"

#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>

namespace RW
{
    using json = nlohmann::json;

json Settings::ToJson() const
{
    json j;
    j["volume"] = volume;
    j["muted"] = muted;
    j["shuffle"] = shuffle;
    j["repeat_mode"] = RepeatModeToString(repeatMode);
    j["log_level"] = logLevel;
    j["log_file"] = logFile;
    j["last_playlist_directory"] = lastPlaylistDirectory;
    return j;
}

Settings Settings::FromJson(const json& data)
{
    Settings settings;
    if (!data.is_object())
    {
        spdlog::warn("Settings document is not an object, using defaults.");
        return settings;
    }

    if (data.contains("volume") && data["volume"].is_number())
        settings.volume = std::clamp(data["volume"].get<int>(), 0, 100);
    if (data.contains("muted") && data["muted"].is_boolean())
        settings.muted = data["muted"].get<bool>();
    if (data.contains("shuffle") && data["shuffle"].is_boolean())
        settings.shuffle = data["shuffle"].get<bool>();

    if (data.contains("repeat_mode") && data["repeat_mode"].is_string())
    {
        const std::string text = data["repeat_mode"].get<std::string>();
        if (auto mode = RepeatModeFromString(text))
            settings.repeatMode = *mode;
        else
            spdlog::warn("Unknown repeat mode '{}' in settings.", text);
    }

    if (data.contains("log_level") && data["log_level"].is_string())
        settings.logLevel = data["log_level"].get<std::string>();
    if (data.contains("log_file") && data["log_file"].is_string())
        settings.logFile = data["log_file"].get<std::string>();
    if (data.contains("last_playlist_directory") && data["last_playlist_directory"].is_string())
        settings.lastPlaylistDirectory = data["last_playlist_directory"].get<std::string>();

    return settings;
}

Settings Settings::LoadFromFile(const std::string& filePath)
{
    try
    {
        std::ifstream file(filePath.c_str());
        if (!file.is_open())
        {
            spdlog::info("No settings file at '{}', using defaults.", filePath);
            return Settings();
        }

        json j;
        file >> j;
        file.close();

        return FromJson(j);
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Error loading settings from '{}': {}", filePath, e.what());
        return Settings();
    }
}

bool Settings::SaveToFile(const std::string& filePath) const
{
    try
    {
        std::ofstream file(filePath.c_str());
        if (!file.is_open())
        {
            spdlog::error("Failed to open file '{}' for writing.", filePath);
            return false;
        }

        file << ToJson().dump(2);
        file.close();

        spdlog::info("Settings saved to '{}'.", filePath);
        return !file.fail();
    }
    catch (const std::exception& e)
    {
        spdlog::error("Error saving settings: {}", e.what());
        return false;
    }
}

} // namespace RW
