// rw_playlist.cpp

#include "rw_playlist.h"
#include "rw_utils.h"

namespace RW
{

Playlist::Playlist(std::string name)
    : m_name(std::move(name))
    , m_id(GenerateUuid())
    , m_creationDate(CurrentTimestamp())
{
    m_lastModified = m_creationDate;
}

void Playlist::AddTrack(Track track)
{
    m_tracks.push_back(std::move(track));
    Touch();
}

std::optional<Track> Playlist::RemoveTrack(int index)
{
    if (!IsValidIndex(index))
    {
        return std::nullopt;
    }

    Track removed = std::move(m_tracks[index]);
    m_tracks.erase(m_tracks.begin() + index);
    Touch();
    return removed;
}

bool Playlist::MoveTrack(int fromIndex, int toIndex)
{
    if (!IsValidIndex(fromIndex) || !IsValidIndex(toIndex))
    {
        return false;
    }

    Track moving = std::move(m_tracks[fromIndex]);
    m_tracks.erase(m_tracks.begin() + fromIndex);
    m_tracks.insert(m_tracks.begin() + toIndex, std::move(moving));
    Touch();
    return true;
}

void Playlist::Clear()
{
    m_tracks.clear();
    Touch();
}

bool Playlist::SetTrackMetadata(int index, Metadata metadata)
{
    if (!IsValidIndex(index))
    {
        return false;
    }

    m_tracks[index].SetMetadata(std::move(metadata));
    return true;
}

std::int64_t Playlist::GetTotalDuration() const
{
    std::int64_t total = 0;
    for (const auto& track : m_tracks)
    {
        auto it = track.GetMetadata().find(MetadataKeys::Duration);
        if (it == track.GetMetadata().end())
        {
            continue;
        }
        if (const auto* duration = std::get_if<std::int64_t>(&it->second))
        {
            total += *duration;
        }
    }
    return total;
}

PlaylistStatistics Playlist::GetStatistics() const
{
    PlaylistStatistics stats;
    stats.name = m_name;
    stats.trackCount = m_tracks.size();
    stats.totalDurationMs = GetTotalDuration();
    stats.totalDurationText = FormatDuration(stats.totalDurationMs / 1000);
    stats.creationDate = m_creationDate;
    stats.lastModified = m_lastModified;
    return stats;
}

void Playlist::Touch()
{
    m_lastModified = CurrentTimestamp();
}

} // namespace RW
