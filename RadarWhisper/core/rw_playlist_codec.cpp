// rw_playlist_codec.cpp

#include "rw_playlist_codec.h"
#include "rw_utils.h"

#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <spdlog/spdlog.h>

namespace RW
{
    using json = nlohmann::json;
    namespace fs = std::filesystem;

namespace
{

std::optional<std::string> OptionalString(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (!it->is_string())
    {
        throw PlaylistError(ErrorKind::ParseFailure,
            std::string("Field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

json StringOrNull(const std::optional<std::string>& value)
{
    return value ? json(*value) : json(nullptr);
}

// Directory holding the playlist file, used to anchor relative entries.
fs::path PlaylistDirectory(const std::string& playlistPath)
{
    return fs::absolute(fs::path(playlistPath)).parent_path();
}

std::string ResolveEntryPath(const fs::path& playlistDir, const std::string& entry)
{
    fs::path entryPath(entry);
    if (entryPath.is_absolute())
    {
        return entryPath.string();
    }
    return (playlistDir / entryPath).lexically_normal().string();
}

bool EntryExists(const std::string& path)
{
    std::error_code ec;
    return fs::exists(path, ec);
}

void ReportMissing(const PlaylistCodec::ErrorReporter& reportError, const std::string& path)
{
    spdlog::warn("File not found: {}", path);
    if (reportError)
    {
        reportError(ErrorKind::NotFound, "File not found: " + path);
    }
}

std::optional<int> ParseEntryNumber(const std::string& suffix)
{
    if (suffix.empty() || suffix.size() > 9)
    {
        return std::nullopt;
    }
    for (char c : suffix)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
    }
    return std::stoi(suffix);
}

std::optional<long long> ParseInteger(const std::string& text)
{
    try
    {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size())
        {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

void StripByteOrderMark(std::string& line)
{
    static const std::string bom = "\xEF\xBB\xBF";
    if (StartsWith(line, bom))
    {
        line.erase(0, bom.size());
    }
}

} // namespace

const char* PlaylistFormatToString(PlaylistFormat format)
{
    switch (format)
    {
    case PlaylistFormat::Json: return "JSON";
    case PlaylistFormat::M3U:  return "M3U";
    case PlaylistFormat::PLS:  return "PLS";
    }
    return "unknown";
}

std::optional<PlaylistFormat> PlaylistCodec::DetectFormat(const std::string& filePath)
{
    const std::string extension = ToLower(fs::path(filePath).extension().string());

    if (extension == ".json")
        return PlaylistFormat::Json;
    if (extension == ".m3u" || extension == ".m3u8")
        return PlaylistFormat::M3U;
    if (extension == ".pls")
        return PlaylistFormat::PLS;
    return std::nullopt;
}

PlaylistFormat PlaylistCodec::ResolveFormat(const std::string& filePath, std::optional<PlaylistFormat> format)
{
    if (format)
    {
        return *format;
    }

    auto detected = DetectFormat(filePath);
    if (!detected)
    {
        throw PlaylistError(ErrorKind::UnsupportedFormat,
            "Unsupported playlist file extension: " + fs::path(filePath).extension().string());
    }
    return *detected;
}

void PlaylistCodec::Save(const Playlist& playlist, const std::string& filePath,
                         std::optional<PlaylistFormat> format)
{
    const PlaylistFormat resolved = ResolveFormat(filePath, format);

    std::ofstream file(filePath.c_str());
    if (!file.is_open())
    {
        throw PlaylistError(ErrorKind::IOFailure, "Failed to open file '" + filePath + "' for writing");
    }

    switch (resolved)
    {
    case PlaylistFormat::Json:
        file << ToJson(playlist).dump(2) << '\n';
        break;
    case PlaylistFormat::M3U:
        WriteM3U(playlist, file);
        break;
    case PlaylistFormat::PLS:
        WritePLS(playlist, file);
        break;
    }

    file.flush();
    if (!file)
    {
        throw PlaylistError(ErrorKind::IOFailure, "Failed to write playlist file '" + filePath + "'");
    }

    spdlog::info("Playlist '{}' written to '{}' as {}.", playlist.GetName(), filePath,
                 PlaylistFormatToString(resolved));
}

Playlist PlaylistCodec::Load(const std::string& filePath, std::optional<PlaylistFormat> format,
                             const ErrorReporter& reportError)
{
    if (!EntryExists(filePath))
    {
        throw PlaylistError(ErrorKind::NotFound, "Playlist file not found: " + filePath);
    }

    const PlaylistFormat resolved = ResolveFormat(filePath, format);

    std::ifstream file(filePath.c_str());
    if (!file.is_open())
    {
        throw PlaylistError(ErrorKind::IOFailure, "Failed to open file '" + filePath + "' for reading");
    }

    std::optional<Playlist> playlist;
    switch (resolved)
    {
    case PlaylistFormat::Json:
    {
        json data;
        try
        {
            file >> data;
        }
        catch (const json::parse_error& e)
        {
            throw PlaylistError(ErrorKind::ParseFailure, std::string("Malformed playlist file: ") + e.what());
        }
        playlist = FromJson(data);
        break;
    }
    case PlaylistFormat::M3U:
        playlist = ReadM3U(file, filePath, reportError);
        break;
    case PlaylistFormat::PLS:
        playlist = ReadPLS(file, filePath, reportError);
        break;
    }

    if (!playlist)
    {
        throw PlaylistError(ErrorKind::ParseFailure, "Failed to parse playlist file: " + filePath);
    }

    spdlog::info("Playlist '{}' read from '{}' with {} tracks.", playlist->GetName(), filePath,
                 playlist->GetTrackCount());
    return std::move(*playlist);
}

json PlaylistCodec::ToJson(const Playlist& playlist)
{
    json j;
    j["name"] = playlist.GetName();
    j["uuid"] = playlist.GetId();
    j["creation_date"] = playlist.GetCreationDate();
    j["last_modified"] = playlist.GetLastModified();
    j["description"] = playlist.GetDescription();
    j["custom_metadata"] = playlist.GetCustomMetadata();
    j["tracks"] = json::array();

    // Only the fields a player needs before the tags are read again.
    for (const auto& track : playlist.GetTracks())
    {
        json trackJson;
        trackJson["file_path"] = track.GetFilePath();
        trackJson["uuid"] = track.GetId();
        trackJson["title"] = StringOrNull(track.GetTitle());
        trackJson["artist"] = StringOrNull(track.GetArtist());
        trackJson["album"] = StringOrNull(track.GetAlbum());

        auto duration = track.GetDurationMs();
        trackJson["duration"] = duration ? json(*duration) : json(nullptr);

        j["tracks"].push_back(trackJson);
    }

    return j;
}

Playlist PlaylistCodec::FromJson(const json& data)
{
    if (!data.is_object())
    {
        throw PlaylistError(ErrorKind::ParseFailure, "Playlist record is not an object");
    }

    auto name = OptionalString(data, "name");
    if (!name)
    {
        throw PlaylistError(ErrorKind::ParseFailure, "Playlist record has no name");
    }

    Playlist playlist(*name);

    if (auto id = OptionalString(data, "uuid"))
    {
        playlist.SetId(*id);
    }
    if (auto created = OptionalString(data, "creation_date"))
    {
        playlist.SetCreationDate(*created);
    }
    playlist.SetLastModified(OptionalString(data, "last_modified").value_or(playlist.GetCreationDate()));
    playlist.SetDescription(OptionalString(data, "description").value_or(""));

    auto custom = data.find("custom_metadata");
    if (custom != data.end() && custom->is_object())
    {
        playlist.SetCustomMetadata(*custom);
    }

    auto tracks = data.find("tracks");
    if (tracks == data.end() || tracks->is_null())
    {
        return playlist;
    }
    if (!tracks->is_array())
    {
        throw PlaylistError(ErrorKind::ParseFailure, "Field 'tracks' is not an array");
    }

    std::vector<Track> loaded;
    loaded.reserve(tracks->size());

    for (const auto& trackJson : *tracks)
    {
        if (!trackJson.is_object())
        {
            throw PlaylistError(ErrorKind::ParseFailure, "Track record is not an object");
        }

        auto filePath = OptionalString(trackJson, "file_path");
        if (!filePath)
        {
            throw PlaylistError(ErrorKind::ParseFailure, "Track record has no file_path");
        }

        Metadata metadata;
        if (auto title = OptionalString(trackJson, "title"))
            metadata[MetadataKeys::Title] = *title;
        if (auto artist = OptionalString(trackJson, "artist"))
            metadata[MetadataKeys::Artist] = *artist;
        if (auto album = OptionalString(trackJson, "album"))
            metadata[MetadataKeys::Album] = *album;

        auto duration = trackJson.find("duration");
        if (duration != trackJson.end() && duration->is_number())
        {
            // Out-of-range values leave the duration unknown.
            std::optional<std::int64_t> durationMs;
            if (duration->is_number_float())
            {
                durationMs = TruncateToInt64(duration->get<double>());
            }
            else if (!duration->is_number_unsigned()
                || duration->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            {
                durationMs = duration->get<std::int64_t>();
            }

            if (durationMs)
                metadata[MetadataKeys::Duration] = *durationMs;
        }

        loaded.emplace_back(*filePath, OptionalString(trackJson, "uuid").value_or(""), std::move(metadata));
    }

    // Restore the recorded modification time after the appends touched it.
    const std::string lastModified = playlist.GetLastModified();
    for (auto& track : loaded)
    {
        playlist.AddTrack(std::move(track));
    }
    playlist.SetLastModified(lastModified);

    return playlist;
}

void PlaylistCodec::WriteM3U(const Playlist& playlist, std::ostream& out)
{
    out << "#EXTM3U\n";

    for (const auto& track : playlist.GetTracks())
    {
        auto duration = track.GetDurationMs();
        auto title = track.GetTitle();
        if (duration && title)
        {
            out << "#EXTINF:" << (*duration / 1000) << ',';

            auto artist = track.GetArtist();
            if (artist && !artist->empty())
            {
                out << *artist << " - ";
            }
            out << *title << '\n';
        }

        out << track.GetFilePath() << '\n';
    }
}

std::optional<Playlist> PlaylistCodec::ReadM3U(std::istream& in, const std::string& playlistPath,
                                               const ErrorReporter& reportError)
{
    Playlist playlist(FileStemOf(playlistPath));
    const fs::path playlistDir = PlaylistDirectory(playlistPath);

    std::string currentTitle;
    std::string currentArtist;
    std::optional<std::int64_t> currentDuration;

    std::string rawLine;
    bool firstLine = true;
    while (std::getline(in, rawLine))
    {
        if (firstLine)
        {
            StripByteOrderMark(rawLine);
            firstLine = false;
        }

        const std::string line = Trim(rawLine);
        if (line.empty() || StartsWith(line, "#EXTM3U"))
        {
            continue;
        }

        if (StartsWith(line, "#EXTINF:"))
        {
            // #EXTINF:<seconds>,<artist> - <title>  or  #EXTINF:<seconds>,<title>
            const std::string info = line.substr(8);
            const auto comma = info.find(',');
            if (comma == std::string::npos)
            {
                continue;
            }

            currentDuration.reset();
            try
            {
                currentDuration = SecondsToMilliseconds(std::stod(info.substr(0, comma)));
            }
            catch (const std::exception&)
            {
                spdlog::debug("Ignoring unreadable EXTINF duration in '{}'.", playlistPath);
            }

            const std::string titlePart = info.substr(comma + 1);
            const auto separator = titlePart.find(" - ");
            if (separator != std::string::npos)
            {
                currentArtist = titlePart.substr(0, separator);
                currentTitle = titlePart.substr(separator + 3);
            }
            else
            {
                currentArtist.clear();
                currentTitle = titlePart;
            }
            continue;
        }

        if (StartsWith(line, "#"))
        {
            continue;
        }

        const std::string trackPath = ResolveEntryPath(playlistDir, line);
        if (EntryExists(trackPath))
        {
            Metadata metadata;
            metadata[MetadataKeys::Title] = currentTitle.empty() ? FileNameOf(trackPath) : currentTitle;
            if (!currentArtist.empty())
                metadata[MetadataKeys::Artist] = currentArtist;
            if (currentDuration)
                metadata[MetadataKeys::Duration] = *currentDuration;

            playlist.AddTrack(Track(trackPath, std::move(metadata)));
        }
        else
        {
            ReportMissing(reportError, trackPath);
        }

        currentTitle.clear();
        currentArtist.clear();
        currentDuration.reset();
    }

    if (playlist.IsEmpty())
    {
        return std::nullopt;
    }
    return playlist;
}

void PlaylistCodec::WritePLS(const Playlist& playlist, std::ostream& out)
{
    out << "[playlist]\n";
    out << "NumberOfEntries=" << playlist.GetTrackCount() << '\n';

    int entry = 1;
    for (const auto& track : playlist.GetTracks())
    {
        auto duration = track.GetDurationMs();
        const long long length = (duration && *duration > 0) ? (*duration / 1000) : -1;

        out << "File" << entry << '=' << track.GetFilePath() << '\n';
        out << "Title" << entry << '=' << track.GetDisplayTitle() << '\n';
        out << "Length" << entry << '=' << length << '\n';
        ++entry;
    }

    out << "Version=2\n";
}

std::optional<Playlist> PlaylistCodec::ReadPLS(std::istream& in, const std::string& playlistPath,
                                               const ErrorReporter& reportError)
{
    Playlist playlist(FileStemOf(playlistPath));
    const fs::path playlistDir = PlaylistDirectory(playlistPath);

    std::map<int, std::string> paths;
    std::map<int, std::string> titles;
    std::map<int, long long> lengths;

    std::string rawLine;
    bool firstLine = true;
    while (std::getline(in, rawLine))
    {
        if (firstLine)
        {
            StripByteOrderMark(rawLine);
            firstLine = false;
        }

        const std::string line = Trim(rawLine);
        if (line.empty() || StartsWith(line, "[playlist]") || StartsWith(line, "Version=")
            || StartsWith(line, "NumberOfEntries="))
        {
            continue;
        }

        const auto equals = line.find('=');
        if (equals == std::string::npos)
        {
            continue;
        }

        const std::string key = line.substr(0, equals);
        const std::string value = line.substr(equals + 1);

        if (StartsWith(key, "File"))
        {
            if (auto number = ParseEntryNumber(key.substr(4)))
                paths[*number] = value;
        }
        else if (StartsWith(key, "Title"))
        {
            if (auto number = ParseEntryNumber(key.substr(5)))
                titles[*number] = value;
        }
        else if (StartsWith(key, "Length"))
        {
            if (auto number = ParseEntryNumber(key.substr(6)))
                lengths[*number] = ParseInteger(value).value_or(-1);
        }
    }

    for (const auto& [number, entry] : paths)
    {
        const std::string trackPath = ResolveEntryPath(playlistDir, entry);
        if (!EntryExists(trackPath))
        {
            ReportMissing(reportError, trackPath);
            continue;
        }

        Metadata metadata;
        auto title = titles.find(number);
        metadata[MetadataKeys::Title] = (title != titles.end()) ? title->second : FileNameOf(trackPath);

        auto length = lengths.find(number);
        if (length != lengths.end() && length->second > 0
            && length->second <= std::numeric_limits<std::int64_t>::max() / 1000)
        {
            metadata[MetadataKeys::Duration] = static_cast<std::int64_t>(length->second) * 1000;
        }

        playlist.AddTrack(Track(trackPath, std::move(metadata)));
    }

    if (playlist.IsEmpty())
    {
        return std::nullopt;
    }
    return playlist;
}

} // namespace RW
