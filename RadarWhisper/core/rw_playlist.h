// rw_playlist.h

#pragma once

#include "rw_track.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace RW
{

struct PlaylistStatistics
{
    std::string name;
    size_t trackCount = 0;
    std::int64_t totalDurationMs = 0;
    std::string totalDurationText;
    std::string creationDate;
    std::string lastModified;
};

class Playlist
{
public:
    explicit Playlist(std::string name);

    const std::string& GetName() const { return m_name; }
    void SetName(std::string name) { m_name = std::move(name); }

    const std::string& GetId() const { return m_id; }
    void SetId(std::string id) { m_id = std::move(id); }

    const std::string& GetCreationDate() const { return m_creationDate; }
    void SetCreationDate(std::string date) { m_creationDate = std::move(date); }

    const std::string& GetLastModified() const { return m_lastModified; }
    void SetLastModified(std::string date) { m_lastModified = std::move(date); }

    const std::string& GetDescription() const { return m_description; }
    void SetDescription(std::string description) { m_description = std::move(description); }

    const nlohmann::json& GetCustomMetadata() const { return m_customMetadata; }
    void SetCustomMetadata(nlohmann::json metadata) { m_customMetadata = std::move(metadata); }

    const std::vector<Track>& GetTracks() const { return m_tracks; }
    size_t GetTrackCount() const { return m_tracks.size(); }
    bool IsEmpty() const { return m_tracks.empty(); }
    bool IsValidIndex(int index) const { return index >= 0 && index < static_cast<int>(m_tracks.size()); }

    const Track& GetTrack(size_t index) const { return m_tracks.at(index); }

    void AddTrack(Track track);
    std::optional<Track> RemoveTrack(int index);
    bool MoveTrack(int fromIndex, int toIndex);
    void Clear();
    bool SetTrackMetadata(int index, Metadata metadata);

    std::int64_t GetTotalDuration() const;
    PlaylistStatistics GetStatistics() const;

private:
    void Touch();

    std::string m_name;
    std::string m_id;
    std::string m_creationDate;
    std::string m_lastModified;
    std::string m_description;
    nlohmann::json m_customMetadata = nlohmann::json::object();
    std::vector<Track> m_tracks;
};

} // namespace RW
