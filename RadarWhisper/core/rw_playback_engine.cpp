// rw_playback_engine.cpp

#include "rw_playback_engine.h"

namespace RW
{

const char* PlaybackStateToString(PlaybackState state)
{
    switch (state)
    {
    case PlaybackState::Stopped: return "stopped";
    case PlaybackState::Playing: return "playing";
    case PlaybackState::Paused:  return "paused";
    }
    return "stopped";
}

void PlaybackEngine::NotifyStateChanged(PlaybackState state)
{
    for (const auto& callback : m_stateCallbacks)
    {
        callback(state);
    }
}

void PlaybackEngine::NotifyPositionChanged(std::int64_t positionMs)
{
    for (const auto& callback : m_positionCallbacks)
    {
        callback(positionMs);
    }
}

void PlaybackEngine::NotifyDurationChanged(std::int64_t durationMs)
{
    for (const auto& callback : m_durationCallbacks)
    {
        callback(durationMs);
    }
}

void PlaybackEngine::NotifyMetadataChanged(const Metadata& metadata)
{
    for (const auto& callback : m_metadataCallbacks)
    {
        callback(metadata);
    }
}

void PlaybackEngine::NotifyError(const std::string& message)
{
    for (const auto& callback : m_errorCallbacks)
    {
        callback(message);
    }
}

void PlaybackEngine::NotifyEndOfMedia()
{
    // Handlers may register further callbacks.
    auto callbacks = m_endOfMediaCallbacks;
    for (const auto& callback : callbacks)
    {
        callback();
    }
}

} // namespace RW
