// rw_playback_engine.h

#pragma once

#include "rw_track.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace RW
{

enum class PlaybackState
{
    Stopped,
    Playing,
    Paused
};

const char* PlaybackStateToString(PlaybackState state);

// Audio output collaborator. Implementations report progress through the
// registered callbacks, from Update() on the caller's thread.
class PlaybackEngine
{
public:
    using StateCallback = std::function<void(PlaybackState)>;
    using TimeCallback = std::function<void(std::int64_t ms)>;
    using MetadataCallback = std::function<void(const Metadata&)>;
    using ErrorCallback = std::function<void(const std::string&)>;
    using EndOfMediaCallback = std::function<void()>;

    virtual ~PlaybackEngine() = default;

    virtual bool Load(const std::string& filePath) = 0;
    virtual bool Play() = 0;
    virtual bool Pause() = 0;
    virtual bool Stop() = 0;
    virtual bool Seek(std::int64_t positionMs) = 0;

    // 0..100
    virtual void SetVolume(int volume) = 0;
    virtual int GetVolume() const = 0;

    virtual void Update(float deltaTime) = 0;

    virtual PlaybackState GetState() const = 0;
    virtual std::int64_t GetPosition() const = 0;
    virtual std::int64_t GetDuration() const = 0;

    void RegisterStateChangedCallback(StateCallback callback) { m_stateCallbacks.push_back(std::move(callback)); }
    void RegisterPositionChangedCallback(TimeCallback callback) { m_positionCallbacks.push_back(std::move(callback)); }
    void RegisterDurationChangedCallback(TimeCallback callback) { m_durationCallbacks.push_back(std::move(callback)); }
    void RegisterMetadataChangedCallback(MetadataCallback callback) { m_metadataCallbacks.push_back(std::move(callback)); }
    void RegisterErrorCallback(ErrorCallback callback) { m_errorCallbacks.push_back(std::move(callback)); }
    void RegisterEndOfMediaCallback(EndOfMediaCallback callback) { m_endOfMediaCallbacks.push_back(std::move(callback)); }

protected:
    void NotifyStateChanged(PlaybackState state);
    void NotifyPositionChanged(std::int64_t positionMs);
    void NotifyDurationChanged(std::int64_t durationMs);
    void NotifyMetadataChanged(const Metadata& metadata);
    void NotifyError(const std::string& message);
    void NotifyEndOfMedia();

private:
    std::vector<StateCallback> m_stateCallbacks;
    std::vector<TimeCallback> m_positionCallbacks;
    std::vector<TimeCallback> m_durationCallbacks;
    std::vector<MetadataCallback> m_metadataCallbacks;
    std::vector<ErrorCallback> m_errorCallbacks;
    std::vector<EndOfMediaCallback> m_endOfMediaCallbacks;
};

} // namespace RW
