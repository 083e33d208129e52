// rw_playlist_manager.cpp

#include "rw_playlist_manager.h"

#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace RW
{
    using json = nlohmann::json;

PlaylistManager::PlaylistManager(MetadataProvider* metadataProvider)
    : m_metadataProvider(metadataProvider)
{
}

PlaylistManager::PlaylistManager(MetadataProvider* metadataProvider, std::uint32_t shuffleSeed)
    : m_metadataProvider(metadataProvider)
    , m_sequencer(shuffleSeed)
{
}

std::string PlaylistManager::CreatePlaylist(const std::string& name)
{
    Playlist playlist(name);
    const std::string id = playlist.GetId();

    m_playlists.push_back(std::move(playlist));

    if (m_playlists.size() == 1)
    {
        m_currentPlaylistId = id;
        ResetSequencer();
    }

    spdlog::info("Playlist '{}' created.", name);
    NotifyPlaylistChanged(id);
    return id;
}

bool PlaylistManager::DeletePlaylist(const std::string& playlistId)
{
    // The argument may refer to the id held by the erased playlist.
    const std::string id = playlistId;

    auto it = std::find_if(m_playlists.begin(), m_playlists.end(),
        [&id](const Playlist& p) { return p.GetId() == id; });

    if (it == m_playlists.end())
    {
        spdlog::error("Playlist '{}' not found.", id);
        return false;
    }

    const std::string name = it->GetName();
    m_playlists.erase(it);

    if (IsCurrent(id))
    {
        const bool hadSelection = m_sequencer.GetCurrentIndex() >= 0;

        if (m_playlists.empty())
            m_currentPlaylistId.reset();
        else
            m_currentPlaylistId = m_playlists.front().GetId();

        ResetSequencer();
        if (hadSelection)
        {
            NotifyCurrentTrackChanged(-1);
        }
    }

    spdlog::info("Playlist '{}' deleted.", name);
    NotifyPlaylistChanged(id);
    return true;
}

bool PlaylistManager::RenamePlaylist(const std::string& playlistId, const std::string& newName)
{
    Playlist* playlist = FindPlaylist(playlistId);
    if (!playlist)
    {
        spdlog::error("Playlist '{}' not found.", playlistId);
        return false;
    }

    const std::string oldName = playlist->GetName();
    playlist->SetName(newName);

    spdlog::info("Playlist renamed from '{}' to '{}'.", oldName, newName);
    NotifyPlaylistChanged(playlistId);
    return true;
}

bool PlaylistManager::SetPlaylistDescription(const std::string& playlistId, const std::string& description)
{
    Playlist* playlist = FindPlaylist(playlistId);
    if (!playlist)
    {
        spdlog::error("Playlist '{}' not found.", playlistId);
        return false;
    }

    playlist->SetDescription(description);
    NotifyPlaylistChanged(playlistId);
    return true;
}

std::optional<std::string> PlaylistManager::DuplicatePlaylist(const std::string& playlistId, const std::string& newName)
{
    const Playlist* source = FindPlaylist(playlistId);
    if (!source)
    {
        spdlog::error("Source playlist '{}' not found.", playlistId);
        return std::nullopt;
    }

    Playlist copy(newName);
    copy.SetDescription(source->GetDescription());
    copy.SetCustomMetadata(source->GetCustomMetadata());
    for (const auto& track : source->GetTracks())
    {
        copy.AddTrack(Track(track.GetFilePath(), track.GetMetadata()));
    }

    const std::string sourceName = source->GetName();
    const std::string id = copy.GetId();
    m_playlists.push_back(std::move(copy));

    spdlog::info("Playlist '{}' duplicated to '{}'.", sourceName, newName);
    NotifyPlaylistChanged(id);
    return id;
}

const Playlist* PlaylistManager::GetPlaylist(const std::string& playlistId) const
{
    return FindPlaylist(playlistId);
}

const Playlist* PlaylistManager::GetCurrentPlaylist() const
{
    return m_currentPlaylistId ? FindPlaylist(*m_currentPlaylistId) : nullptr;
}

std::vector<std::string> PlaylistManager::GetPlaylistNames() const
{
    std::vector<std::string> names;
    names.reserve(m_playlists.size());

    for (const auto& playlist : m_playlists)
    {
        names.push_back(playlist.GetName());
    }

    return names;
}

bool PlaylistManager::SetCurrentPlaylist(const std::string& playlistId)
{
    if (!FindPlaylist(playlistId))
    {
        spdlog::error("Playlist '{}' not found.", playlistId);
        return false;
    }

    const bool hadSelection = m_sequencer.GetCurrentIndex() >= 0;

    m_currentPlaylistId = playlistId;
    ResetSequencer();

    if (hadSelection)
    {
        NotifyCurrentTrackChanged(-1);
    }
    NotifyPlaylistChanged(playlistId);
    return true;
}

bool PlaylistManager::AddTrack(const std::string& playlistId, const std::string& filePath)
{
    return AddTracks(playlistId, { filePath }) == 1;
}

size_t PlaylistManager::AddTracks(const std::string& playlistId, const std::vector<std::string>& filePaths)
{
    Playlist* playlist = FindPlaylist(playlistId);
    if (!playlist)
    {
        spdlog::error("Playlist '{}' not found.", playlistId);
        return 0;
    }

    const size_t previousCount = playlist->GetTrackCount();
    size_t added = 0;

    for (const auto& filePath : filePaths)
    {
        auto track = MakeTrack(filePath);
        if (!track)
        {
            continue;
        }

        playlist->AddTrack(std::move(*track));
        ++added;
    }

    if (added == 0)
    {
        return 0;
    }

    if (IsCurrent(playlistId))
    {
        m_sequencer.OnTracksAppended(previousCount, playlist->GetTrackCount());
    }

    spdlog::info("Added {} of {} tracks to playlist '{}'.", added, filePaths.size(), playlist->GetName());
    NotifyPlaylistChanged(playlistId);
    return added;
}

bool PlaylistManager::RemoveTrack(const std::string& playlistId, int index)
{
    Playlist* playlist = FindPlaylist(playlistId);
    if (!playlist)
    {
        spdlog::error("Playlist '{}' not found.", playlistId);
        return false;
    }

    if (!playlist->RemoveTrack(index))
    {
        spdlog::error("Index {} out of range for playlist '{}'.", index, playlist->GetName());
        return false;
    }

    spdlog::info("Removed track at index {} from playlist '{}'.", index, playlist->GetName());

    if (IsCurrent(playlistId) && m_sequencer.OnTrackRemoved(index))
    {
        NotifyCurrentTrackChanged(m_sequencer.GetCurrentIndex());
    }

    NotifyPlaylistChanged(playlistId);
    return true;
}

bool PlaylistManager::MoveTrack(const std::string& playlistId, int fromIndex, int toIndex)
{
    Playlist* playlist = FindPlaylist(playlistId);
    if (!playlist)
    {
        spdlog::error("Playlist '{}' not found.", playlistId);
        return false;
    }

    if (!playlist->MoveTrack(fromIndex, toIndex))
    {
        spdlog::error("Invalid source or target index for track move operation.");
        return false;
    }

    spdlog::info("Moved track from index {} to index {} in playlist '{}'.",
                fromIndex, toIndex, playlist->GetName());

    if (IsCurrent(playlistId) && m_sequencer.OnTrackMoved(fromIndex, toIndex))
    {
        NotifyCurrentTrackChanged(m_sequencer.GetCurrentIndex());
    }

    NotifyPlaylistChanged(playlistId);
    return true;
}

bool PlaylistManager::MoveTrackUp(const std::string& playlistId, int index)
{
    return MoveTrack(playlistId, index, index - 1);
}

bool PlaylistManager::MoveTrackDown(const std::string& playlistId, int index)
{
    return MoveTrack(playlistId, index, index + 1);
}

bool PlaylistManager::ClearPlaylist(const std::string& playlistId)
{
    Playlist* playlist = FindPlaylist(playlistId);
    if (!playlist)
    {
        spdlog::error("Playlist '{}' not found.", playlistId);
        return false;
    }

    playlist->Clear();
    spdlog::info("Cleared all tracks from playlist '{}'.", playlist->GetName());

    if (IsCurrent(playlistId))
    {
        const bool hadSelection = m_sequencer.GetCurrentIndex() >= 0;
        m_sequencer.OnTracksCleared();
        if (hadSelection)
        {
            NotifyCurrentTrackChanged(-1);
        }
    }

    NotifyPlaylistChanged(playlistId);
    return true;
}

size_t PlaylistManager::RefreshMetadata(const std::string& playlistId)
{
    Playlist* playlist = FindPlaylist(playlistId);
    if (!playlist || !m_metadataProvider)
    {
        return 0;
    }

    size_t refreshed = 0;
    for (int i = 0; i < static_cast<int>(playlist->GetTrackCount()); ++i)
    {
        const std::string filePath = playlist->GetTrack(i).GetFilePath();
        try
        {
            playlist->SetTrackMetadata(i, m_metadataProvider->GetMetadata(filePath));
            ++refreshed;
        }
        catch (const PlaylistError& e)
        {
            ReportError(e.GetKind(), "Error reading tags of " + filePath + ": " + e.what());
        }
        catch (const std::exception& e)
        {
            ReportError(ErrorKind::IOFailure, "Error reading tags of " + filePath + ": " + e.what());
        }
    }

    if (refreshed > 0)
    {
        NotifyPlaylistChanged(playlistId);
    }
    return refreshed;
}

std::optional<TrackSelection> PlaylistManager::GetCurrentTrack() const
{
    const Playlist* playlist = GetCurrentPlaylist();
    const int index = m_sequencer.GetCurrentIndex();

    if (!playlist || !playlist->IsValidIndex(index))
    {
        return std::nullopt;
    }

    return TrackSelection{ playlist->GetTrack(index), index };
}

bool PlaylistManager::SetCurrentTrack(int index)
{
    const Playlist* playlist = GetCurrentPlaylist();
    if (!playlist || !playlist->IsValidIndex(index))
    {
        return false;
    }

    m_sequencer.SetCurrentIndex(index);
    NotifyCurrentTrackChanged(index);
    return true;
}

std::optional<TrackSelection> PlaylistManager::GetNextTrack()
{
    return Select(m_sequencer.Next(CurrentTrackCount()));
}

std::optional<TrackSelection> PlaylistManager::GetPreviousTrack()
{
    return Select(m_sequencer.Previous(CurrentTrackCount()));
}

void PlaylistManager::SetShuffleMode(bool enabled)
{
    m_sequencer.SetShuffleEnabled(enabled, CurrentTrackCount());
    spdlog::info("Shuffle {}.", enabled ? "enabled" : "disabled");
}

void PlaylistManager::SetRepeatMode(RepeatMode mode)
{
    m_sequencer.SetRepeatMode(mode);
    spdlog::info("Repeat mode set to '{}'.", RepeatModeToString(mode));
}

bool PlaylistManager::SavePlaylist(const std::string& playlistId, const std::string& filePath,
                                   std::optional<PlaylistFormat> format)
{
    const Playlist* playlist = FindPlaylist(playlistId);
    if (!playlist)
    {
        ReportError(ErrorKind::NotFound, "Playlist with id " + playlistId + " not found");
        return false;
    }

    try
    {
        PlaylistCodec::Save(*playlist, filePath, format);
    }
    catch (const PlaylistError& e)
    {
        ReportError(e.GetKind(), std::string("Error saving playlist: ") + e.what());
        return false;
    }
    catch (const std::exception& e)
    {
        ReportError(ErrorKind::IOFailure, std::string("Error saving playlist: ") + e.what());
        return false;
    }

    NotifyPlaylistSaved(playlistId);
    return true;
}

std::optional<std::string> PlaylistManager::LoadPlaylist(const std::string& filePath,
                                                         std::optional<PlaylistFormat> format)
{
    try
    {
        auto reporter = [this](ErrorKind kind, const std::string& message) { ReportError(kind, message); };
        Playlist playlist = PlaylistCodec::Load(filePath, format, reporter);

        const std::string id = RegisterPlaylist(std::move(playlist));
        NotifyPlaylistLoaded(id);
        return id;
    }
    catch (const PlaylistError& e)
    {
        ReportError(e.GetKind(), std::string("Error loading playlist: ") + e.what());
    }
    catch (const std::exception& e)
    {
        ReportError(ErrorKind::IOFailure, std::string("Error loading playlist: ") + e.what());
    }

    return std::nullopt;
}

bool PlaylistManager::ExportPlaylist(const std::string& playlistId, const std::string& filePath, PlaylistFormat format)
{
    return SavePlaylist(playlistId, filePath, format);
}

std::optional<std::string> PlaylistManager::ImportPlaylist(const std::string& filePath,
                                                           std::optional<PlaylistFormat> format)
{
    return LoadPlaylist(filePath, format);
}

bool PlaylistManager::SaveSession(const std::string& filePath) const
{
    try
    {
        json j;
        j["current_playlist"] = m_currentPlaylistId ? json(*m_currentPlaylistId) : json(nullptr);
        j["playlists"] = json::array();

        for (const auto& playlist : m_playlists)
        {
            j["playlists"].push_back(PlaylistCodec::ToJson(playlist));
        }

        std::ofstream file(filePath.c_str());
        if (!file.is_open())
        {
            ReportError(ErrorKind::IOFailure, "Failed to open file '" + filePath + "' for writing");
            return false;
        }

        file << j.dump(2);
        file.close();
        if (file.fail())
        {
            ReportError(ErrorKind::IOFailure, "Failed to write session file '" + filePath + "'");
            return false;
        }

        spdlog::info("All playlists saved to '{}'.", filePath);
        return true;
    }
    catch (const std::exception& e)
    {
        ReportError(ErrorKind::IOFailure, std::string("Error saving playlists: ") + e.what());
        return false;
    }
}

bool PlaylistManager::LoadSession(const std::string& filePath)
{
    try
    {
        std::ifstream file(filePath.c_str());
        if (!file.is_open())
        {
            ReportError(ErrorKind::NotFound, "Failed to open file '" + filePath + "' for reading");
            return false;
        }

        json j;
        file >> j;
        file.close();

        if (!j.is_object() || !j.contains("playlists") || !j["playlists"].is_array())
        {
            ReportError(ErrorKind::ParseFailure, "Session file '" + filePath + "' has no playlist list");
            return false;
        }

        std::vector<Playlist> newPlaylists;
        for (const auto& playlistJson : j["playlists"])
        {
            newPlaylists.push_back(PlaylistCodec::FromJson(playlistJson));
        }

        m_playlists = std::move(newPlaylists);
        m_currentPlaylistId.reset();

        const auto current = j.find("current_playlist");
        if (current != j.end() && current->is_string() && FindPlaylist(current->get<std::string>()))
        {
            m_currentPlaylistId = current->get<std::string>();
        }
        else if (!m_playlists.empty())
        {
            m_currentPlaylistId = m_playlists.front().GetId();
        }
        ResetSequencer();

        spdlog::info("Loaded {} playlists from '{}'.", m_playlists.size(), filePath);
        for (const auto& playlist : m_playlists)
        {
            NotifyPlaylistLoaded(playlist.GetId());
        }
        return true;
    }
    catch (const PlaylistError& e)
    {
        ReportError(e.GetKind(), std::string("Error loading playlists: ") + e.what());
    }
    catch (const json::exception& e)
    {
        ReportError(ErrorKind::ParseFailure, std::string("Error loading playlists: ") + e.what());
    }
    catch (const std::exception& e)
    {
        ReportError(ErrorKind::IOFailure, std::string("Error loading playlists: ") + e.what());
    }

    return false;
}

void PlaylistManager::RegisterPlaylistChangeCallback(PlaylistChangeCallback callback)
{
    m_changeCallbacks.push_back(std::move(callback));
}

void PlaylistManager::RegisterCurrentTrackChangeCallback(CurrentTrackChangeCallback callback)
{
    m_currentTrackCallbacks.push_back(std::move(callback));
}

void PlaylistManager::RegisterPlaylistLoadedCallback(PlaylistChangeCallback callback)
{
    m_loadedCallbacks.push_back(std::move(callback));
}

void PlaylistManager::RegisterPlaylistSavedCallback(PlaylistChangeCallback callback)
{
    m_savedCallbacks.push_back(std::move(callback));
}

void PlaylistManager::RegisterErrorCallback(ErrorCallback callback)
{
    m_errorCallbacks.push_back(std::move(callback));
}

Playlist* PlaylistManager::FindPlaylist(const std::string& playlistId)
{
    auto it = std::find_if(m_playlists.begin(), m_playlists.end(),
        [&playlistId](const Playlist& p) { return p.GetId() == playlistId; });

    return (it != m_playlists.end()) ? &(*it) : nullptr;
}

const Playlist* PlaylistManager::FindPlaylist(const std::string& playlistId) const
{
    auto it = std::find_if(m_playlists.begin(), m_playlists.end(),
        [&playlistId](const Playlist& p) { return p.GetId() == playlistId; });

    return (it != m_playlists.end()) ? &(*it) : nullptr;
}

Playlist* PlaylistManager::FindCurrentPlaylist()
{
    return m_currentPlaylistId ? FindPlaylist(*m_currentPlaylistId) : nullptr;
}

bool PlaylistManager::IsCurrent(const std::string& playlistId) const
{
    return m_currentPlaylistId && *m_currentPlaylistId == playlistId;
}

size_t PlaylistManager::CurrentTrackCount() const
{
    const Playlist* playlist = GetCurrentPlaylist();
    return playlist ? playlist->GetTrackCount() : 0;
}

void PlaylistManager::ResetSequencer()
{
    m_sequencer.Reset();
    if (m_sequencer.IsShuffleEnabled())
    {
        m_sequencer.GenerateShuffleOrder(CurrentTrackCount());
    }
}

std::optional<Track> PlaylistManager::MakeTrack(const std::string& filePath)
{
    if (!m_metadataProvider)
    {
        return Track(filePath);
    }

    try
    {
        return Track(filePath, m_metadataProvider->GetMetadata(filePath));
    }
    catch (const PlaylistError& e)
    {
        ReportError(e.GetKind(), "Error adding track " + filePath + ": " + e.what());
    }
    catch (const std::exception& e)
    {
        ReportError(ErrorKind::IOFailure, "Error adding track " + filePath + ": " + e.what());
    }

    return std::nullopt;
}

std::optional<TrackSelection> PlaylistManager::Select(int index)
{
    Playlist* playlist = FindCurrentPlaylist();
    if (!playlist || !playlist->IsValidIndex(index))
    {
        return std::nullopt;
    }

    NotifyCurrentTrackChanged(index);
    return TrackSelection{ playlist->GetTrack(index), index };
}

std::string PlaylistManager::RegisterPlaylist(Playlist playlist)
{
    const std::string id = playlist.GetId();

    Playlist* existing = FindPlaylist(id);
    if (existing)
    {
        spdlog::warn("Playlist '{}' already exists. It will be overwritten.", playlist.GetName());
        *existing = std::move(playlist);
        if (IsCurrent(id))
        {
            const bool hadSelection = m_sequencer.GetCurrentIndex() >= 0;
            ResetSequencer();
            if (hadSelection)
            {
                NotifyCurrentTrackChanged(-1);
            }
        }
        NotifyPlaylistChanged(id);
    }
    else
    {
        m_playlists.push_back(std::move(playlist));
    }

    if (!m_currentPlaylistId)
    {
        m_currentPlaylistId = id;
        ResetSequencer();
    }

    return id;
}

void PlaylistManager::NotifyPlaylistChanged(const std::string& playlistId)
{
    for (const auto& callback : m_changeCallbacks)
    {
        callback(playlistId);
    }
}

void PlaylistManager::NotifyCurrentTrackChanged(int index)
{
    for (const auto& callback : m_currentTrackCallbacks)
    {
        callback(index);
    }
}

void PlaylistManager::NotifyPlaylistLoaded(const std::string& playlistId)
{
    for (const auto& callback : m_loadedCallbacks)
    {
        callback(playlistId);
    }
}

void PlaylistManager::NotifyPlaylistSaved(const std::string& playlistId) const
{
    for (const auto& callback : m_savedCallbacks)
    {
        callback(playlistId);
    }
}

void PlaylistManager::ReportError(ErrorKind kind, const std::string& message) const
{
    spdlog::error("{} ({})", message, ErrorKindToString(kind));
    for (const auto& callback : m_errorCallbacks)
    {
        callback(kind, message);
    }
}

} // namespace RW
