// rw_playlist_codec.h

#pragma once

#include "rw_errors.h"
#include "rw_playlist.h"

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace RW
{

enum class PlaylistFormat
{
    Json,
    M3U,
    PLS
};

const char* PlaylistFormatToString(PlaylistFormat format);

// Reads and writes playlists as native JSON, extended M3U and PLS.
// Fatal problems are thrown as PlaylistError; entries that point at
// missing files are passed to the reporter and skipped.
class PlaylistCodec
{
public:
    using ErrorReporter = std::function<void(ErrorKind, const std::string&)>;

    // By extension: .json, .m3u/.m3u8, .pls (case insensitive).
    static std::optional<PlaylistFormat> DetectFormat(const std::string& filePath);

    static void Save(const Playlist& playlist, const std::string& filePath,
                     std::optional<PlaylistFormat> format = std::nullopt);
    static Playlist Load(const std::string& filePath,
                         std::optional<PlaylistFormat> format = std::nullopt,
                         const ErrorReporter& reportError = nullptr);

    static nlohmann::json ToJson(const Playlist& playlist);
    static Playlist FromJson(const nlohmann::json& data);

    static void WriteM3U(const Playlist& playlist, std::ostream& out);
    static std::optional<Playlist> ReadM3U(std::istream& in, const std::string& playlistPath,
                                           const ErrorReporter& reportError = nullptr);

    static void WritePLS(const Playlist& playlist, std::ostream& out);
    static std::optional<Playlist> ReadPLS(std::istream& in, const std::string& playlistPath,
                                           const ErrorReporter& reportError = nullptr);

private:
    static PlaylistFormat ResolveFormat(const std::string& filePath, std::optional<PlaylistFormat> format);
};

} // namespace RW
