// rw_player.h

#pragma once

#include "rw_playback_engine.h"
#include "rw_playlist_manager.h"

#include <functional>
#include <optional>
#include <vector>

namespace RW
{

// Drives a playback engine from the playlist manager's sequencing:
// transport controls, auto-advance at end of media, volume and mute.
class Player
{
public:
    using NowPlayingCallback = std::function<void(const TrackSelection&)>;
    using FinishedCallback = std::function<void()>;

    Player(PlaylistManager& manager, PlaybackEngine& engine);

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    // Plays the current track, or the first one the sequencer resolves.
    bool PlayCurrent();
    bool PlayIndex(int index);
    bool Next();
    bool Previous();
    bool TogglePlayPause();
    bool Stop();
    bool Seek(std::int64_t positionMs);

    void SetVolume(int volume);
    int GetVolume() const { return m_volume; }
    void SetMuted(bool muted);
    bool IsMuted() const { return m_muted; }

    PlaybackState GetState() const { return m_engine.GetState(); }
    std::optional<TrackSelection> GetNowPlaying() const { return m_manager.GetCurrentTrack(); }

    // True once auto-advance ran out of tracks; cleared by any new playback.
    bool HasFinished() const { return m_finished; }

    void RegisterNowPlayingCallback(NowPlayingCallback callback);
    void RegisterFinishedCallback(FinishedCallback callback);

private:
    bool Start(const TrackSelection& selection);
    void OnEndOfMedia();
    void ApplyVolume();

    PlaylistManager& m_manager;
    PlaybackEngine& m_engine;

    int m_volume = 100;
    bool m_muted = false;
    bool m_finished = false;

    std::vector<NowPlayingCallback> m_nowPlayingCallbacks;
    std::vector<FinishedCallback> m_finishedCallbacks;
};

} // namespace RW
