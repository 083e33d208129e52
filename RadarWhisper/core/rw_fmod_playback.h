// rw_fmod_playback.h
#pragma once

#include "rw_playback_engine.h"

#include <fmod.hpp>
#include <fmod_errors.h>
#include <string>

namespace RW
{

// Streams one file at a time through an FMOD system it owns.
class FmodPlaybackEngine : public PlaybackEngine
{
public:
    FmodPlaybackEngine() = default;
    ~FmodPlaybackEngine() override;

    FmodPlaybackEngine(const FmodPlaybackEngine&) = delete;
    FmodPlaybackEngine& operator=(const FmodPlaybackEngine&) = delete;

    bool Initialize();
    void Shutdown();

    bool Load(const std::string& filePath) override;
    bool Play() override;
    bool Pause() override;
    bool Stop() override;
    bool Seek(std::int64_t positionMs) override;

    void SetVolume(int volume) override;
    int GetVolume() const override { return m_volume; }

    void Update(float deltaTime) override;

    PlaybackState GetState() const override { return m_state; }
    std::int64_t GetPosition() const override;
    std::int64_t GetDuration() const override { return m_durationMs; }

private:
    void UnloadSound();
    void SetState(PlaybackState state);
    bool Check(FMOD_RESULT result, const char* what);
    Metadata ReadTags();

    FMOD::System* m_system = nullptr;
    FMOD::Sound* m_sound = nullptr;
    FMOD::Channel* m_channel = nullptr;
    std::string m_filePath;

    PlaybackState m_state = PlaybackState::Stopped;
    std::int64_t m_durationMs = 0;
    int m_volume = 100;
    float m_positionTimer = 0.0f;
};

} // namespace RW
