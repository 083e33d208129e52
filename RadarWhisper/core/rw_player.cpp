// rw_player.cpp

#include "rw_player.h"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace RW
{

Player::Player(PlaylistManager& manager, PlaybackEngine& engine)
    : m_manager(manager)
    , m_engine(engine)
{
    m_engine.RegisterEndOfMediaCallback([this]() { OnEndOfMedia(); });
    m_engine.RegisterErrorCallback([](const std::string& message) {
        spdlog::error("Playback error: {}", message);
    });

    m_volume = m_engine.GetVolume();
}

bool Player::PlayCurrent()
{
    auto current = m_manager.GetCurrentTrack();
    if (!current)
    {
        current = m_manager.GetNextTrack();
    }

    if (!current)
    {
        spdlog::warn("No tracks to play.");
        return false;
    }

    return Start(*current);
}

bool Player::PlayIndex(int index)
{
    if (!m_manager.SetCurrentTrack(index))
    {
        spdlog::error("No track at index {} in the current playlist.", index);
        return false;
    }

    auto current = m_manager.GetCurrentTrack();
    return current && Start(*current);
}

bool Player::Next()
{
    auto next = m_manager.GetNextTrack();
    if (!next)
    {
        spdlog::info("No next track available.");
        return false;
    }

    return Start(*next);
}

bool Player::Previous()
{
    auto previous = m_manager.GetPreviousTrack();
    if (!previous)
    {
        spdlog::info("No previous track available.");
        return false;
    }

    return Start(*previous);
}

bool Player::TogglePlayPause()
{
    switch (m_engine.GetState())
    {
    case PlaybackState::Playing:
        return m_engine.Pause();
    case PlaybackState::Paused:
        return m_engine.Play();
    case PlaybackState::Stopped:
        break;
    }

    return PlayCurrent();
}

bool Player::Stop()
{
    return m_engine.Stop();
}

bool Player::Seek(std::int64_t positionMs)
{
    return m_engine.Seek(positionMs);
}

void Player::SetVolume(int volume)
{
    m_volume = std::clamp(volume, 0, 100);
    ApplyVolume();
}

void Player::SetMuted(bool muted)
{
    m_muted = muted;
    ApplyVolume();
}

void Player::RegisterNowPlayingCallback(NowPlayingCallback callback)
{
    m_nowPlayingCallbacks.push_back(std::move(callback));
}

void Player::RegisterFinishedCallback(FinishedCallback callback)
{
    m_finishedCallbacks.push_back(std::move(callback));
}

bool Player::Start(const TrackSelection& selection)
{
    m_finished = false;

    const Track& track = selection.track;
    if (!m_engine.Load(track.GetFilePath()))
    {
        return false;
    }

    ApplyVolume();
    if (!m_engine.Play())
    {
        return false;
    }

    spdlog::info("Now playing: {}", track.GetDisplayTitle());
    for (const auto& callback : m_nowPlayingCallbacks)
    {
        callback(selection);
    }
    return true;
}

void Player::OnEndOfMedia()
{
    auto next = m_manager.GetNextTrack();
    if (next && Start(*next))
    {
        return;
    }

    m_finished = true;
    spdlog::info("Playback finished.");
    for (const auto& callback : m_finishedCallbacks)
    {
        callback();
    }
}

void Player::ApplyVolume()
{
    m_engine.SetVolume(m_muted ? 0 : m_volume);
}

} // namespace RW
