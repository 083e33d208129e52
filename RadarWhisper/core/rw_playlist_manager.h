// rw_playlist_manager.h

#pragma once

#include "rw_errors.h"
#include "rw_metadata_provider.h"
#include "rw_playlist.h"
#include "rw_playlist_codec.h"
#include "rw_sequencer.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace RW
{

struct TrackSelection
{
    Track track;
    int index = -1;
};

// Owns every playlist, the current playlist and the sequencing state.
// Failing operations return false / nullopt; load, save and tag lookup
// problems are also delivered to the error callbacks.
class PlaylistManager
{
public:
    explicit PlaylistManager(MetadataProvider* metadataProvider = nullptr);
    PlaylistManager(MetadataProvider* metadataProvider, std::uint32_t shuffleSeed);

    PlaylistManager(const PlaylistManager&) = delete;
    PlaylistManager& operator=(const PlaylistManager&) = delete;

    std::string CreatePlaylist(const std::string& name);
    bool DeletePlaylist(const std::string& playlistId);
    bool RenamePlaylist(const std::string& playlistId, const std::string& newName);
    bool SetPlaylistDescription(const std::string& playlistId, const std::string& description);
    std::optional<std::string> DuplicatePlaylist(const std::string& playlistId, const std::string& newName);

    const Playlist* GetPlaylist(const std::string& playlistId) const;
    const Playlist* GetCurrentPlaylist() const;
    const std::vector<Playlist>& GetAllPlaylists() const { return m_playlists; }
    std::vector<std::string> GetPlaylistNames() const;
    std::optional<std::string> GetCurrentPlaylistId() const { return m_currentPlaylistId; }
    bool SetCurrentPlaylist(const std::string& playlistId);

    bool AddTrack(const std::string& playlistId, const std::string& filePath);
    size_t AddTracks(const std::string& playlistId, const std::vector<std::string>& filePaths);
    bool RemoveTrack(const std::string& playlistId, int index);
    bool MoveTrack(const std::string& playlistId, int fromIndex, int toIndex);
    bool MoveTrackUp(const std::string& playlistId, int index);
    bool MoveTrackDown(const std::string& playlistId, int index);
    bool ClearPlaylist(const std::string& playlistId);

    // Reads full tags again for every track, keeping track ids. Returns the refreshed count.
    size_t RefreshMetadata(const std::string& playlistId);

    std::optional<TrackSelection> GetCurrentTrack() const;
    int GetCurrentTrackIndex() const { return m_sequencer.GetCurrentIndex(); }
    bool SetCurrentTrack(int index);

    std::optional<TrackSelection> GetNextTrack();
    std::optional<TrackSelection> GetPreviousTrack();

    void SetShuffleMode(bool enabled);
    bool IsShuffleEnabled() const { return m_sequencer.IsShuffleEnabled(); }
    void SetRepeatMode(RepeatMode mode);
    RepeatMode GetRepeatMode() const { return m_sequencer.GetRepeatMode(); }
    const Sequencer& GetSequencer() const { return m_sequencer; }

    bool SavePlaylist(const std::string& playlistId, const std::string& filePath,
                      std::optional<PlaylistFormat> format = std::nullopt);
    std::optional<std::string> LoadPlaylist(const std::string& filePath,
                                            std::optional<PlaylistFormat> format = std::nullopt);
    bool ExportPlaylist(const std::string& playlistId, const std::string& filePath, PlaylistFormat format);
    std::optional<std::string> ImportPlaylist(const std::string& filePath,
                                              std::optional<PlaylistFormat> format = std::nullopt);

    bool SaveSession(const std::string& filePath) const;
    bool LoadSession(const std::string& filePath);

    using PlaylistChangeCallback = std::function<void(const std::string& playlistId)>;
    using CurrentTrackChangeCallback = std::function<void(int index)>;
    using ErrorCallback = std::function<void(ErrorKind kind, const std::string& message)>;

    void RegisterPlaylistChangeCallback(PlaylistChangeCallback callback);
    void RegisterCurrentTrackChangeCallback(CurrentTrackChangeCallback callback);
    void RegisterPlaylistLoadedCallback(PlaylistChangeCallback callback);
    void RegisterPlaylistSavedCallback(PlaylistChangeCallback callback);
    void RegisterErrorCallback(ErrorCallback callback);

private:
    Playlist* FindPlaylist(const std::string& playlistId);
    const Playlist* FindPlaylist(const std::string& playlistId) const;
    Playlist* FindCurrentPlaylist();
    bool IsCurrent(const std::string& playlistId) const;
    size_t CurrentTrackCount() const;
    void ResetSequencer();

    std::optional<Track> MakeTrack(const std::string& filePath);
    std::optional<TrackSelection> Select(int index);
    std::string RegisterPlaylist(Playlist playlist);

    void NotifyPlaylistChanged(const std::string& playlistId);
    void NotifyCurrentTrackChanged(int index);
    void NotifyPlaylistLoaded(const std::string& playlistId);
    void NotifyPlaylistSaved(const std::string& playlistId) const;
    void ReportError(ErrorKind kind, const std::string& message) const;

    MetadataProvider* m_metadataProvider;

    std::vector<Playlist> m_playlists;
    std::optional<std::string> m_currentPlaylistId;
    Sequencer m_sequencer;

    std::vector<PlaylistChangeCallback> m_changeCallbacks;
    std::vector<CurrentTrackChangeCallback> m_currentTrackCallbacks;
    std::vector<PlaylistChangeCallback> m_loadedCallbacks;
    std::vector<PlaylistChangeCallback> m_savedCallbacks;
    std::vector<ErrorCallback> m_errorCallbacks;
};

} // namespace RW
