// rw_fmod_playback.cpp

#include "rw_fmod_playback.h"
#include "rw_utils.h"

#include <algorithm>
#include <cstring>
#include <spdlog/spdlog.h>

namespace RW
{

namespace
{
    constexpr float kPositionInterval = 0.25f;

    struct TagMapping
    {
        const char* tagName;
        const char* key;
    };

    // ID3v2 frames first, then Vorbis comments / generic names.
    constexpr TagMapping kTagMappings[] = {
        { "TIT2", MetadataKeys::Title },
        { "TPE1", MetadataKeys::Artist },
        { "TALB", MetadataKeys::Album },
        { "TITLE", MetadataKeys::Title },
        { "ARTIST", MetadataKeys::Artist },
        { "ALBUM", MetadataKeys::Album },
    };
}

FmodPlaybackEngine::~FmodPlaybackEngine()
{
    Shutdown();
}

bool FmodPlaybackEngine::Initialize()
{
    if (m_system)
    {
        return true;
    }

    FMOD_RESULT result;

    result = FMOD::System_Create(&m_system);
    if (result != FMOD_OK)
    {
        spdlog::error("Failed to create FMOD system: {}", FMOD_ErrorString(result));
        m_system = nullptr;
        return false;
    }

    result = m_system->init(512, FMOD_INIT_NORMAL, nullptr);
    if (result != FMOD_OK)
    {
        spdlog::error("Failed to initialize FMOD system: {}", FMOD_ErrorString(result));
        m_system->release();
        m_system = nullptr;
        return false;
    }

    spdlog::info("FMOD initialized successfully.");
    return true;
}

void FmodPlaybackEngine::Shutdown()
{
    if (!m_system)
    {
        return;
    }

    UnloadSound();

    m_system->close();
    m_system->release();
    m_system = nullptr;

    spdlog::info("FMOD shutdown successfully.");
}

bool FmodPlaybackEngine::Load(const std::string& filePath)
{
    if (!m_system)
    {
        NotifyError("Audio system is not initialized");
        return false;
    }

    UnloadSound();
    SetState(PlaybackState::Stopped);

    FMOD::Sound* newSound = nullptr;
    FMOD_RESULT result = m_system->createSound(filePath.c_str(), FMOD_CREATESTREAM, nullptr, &newSound);
    if (result != FMOD_OK)
    {
        spdlog::error("FMOD createSound failed: {} for file: {}", FMOD_ErrorString(result), filePath);
        NotifyError(std::string("Cannot open ") + filePath + ": " + FMOD_ErrorString(result));
        return false;
    }

    m_sound = newSound;
    m_filePath = filePath;

    unsigned int length = 0;
    if (Check(m_sound->getLength(&length, FMOD_TIMEUNIT_MS), "getLength"))
    {
        m_durationMs = static_cast<std::int64_t>(length);
        NotifyDurationChanged(m_durationMs);
    }

    Metadata tags = ReadTags();
    if (!tags.empty())
    {
        NotifyMetadataChanged(tags);
    }

    spdlog::info("Sound loaded successfully: {}", FileNameOf(filePath));
    return true;
}

bool FmodPlaybackEngine::Play()
{
    if (!m_sound)
    {
        return false;
    }

    if (m_channel && m_state == PlaybackState::Paused)
    {
        if (!Check(m_channel->setPaused(false), "setPaused"))
        {
            return false;
        }
        SetState(PlaybackState::Playing);
        return true;
    }

    if (m_state == PlaybackState::Playing)
    {
        return true;
    }

    FMOD::Channel* channel = nullptr;
    FMOD_RESULT result = m_system->playSound(m_sound, nullptr, true, &channel);
    if (result != FMOD_OK)
    {
        spdlog::error("FMOD playSound failed: {}", FMOD_ErrorString(result));
        NotifyError(std::string("Cannot play ") + m_filePath + ": " + FMOD_ErrorString(result));
        return false;
    }

    m_channel = channel;
    m_channel->setVolume(m_volume / 100.0f);
    m_channel->setPaused(false);

    m_positionTimer = 0.0f;
    SetState(PlaybackState::Playing);
    return true;
}

bool FmodPlaybackEngine::Pause()
{
    if (!m_channel || m_state != PlaybackState::Playing)
    {
        return false;
    }

    if (!Check(m_channel->setPaused(true), "setPaused"))
    {
        return false;
    }

    SetState(PlaybackState::Paused);
    return true;
}

bool FmodPlaybackEngine::Stop()
{
    if (m_channel)
    {
        bool isPlaying = false;
        m_channel->isPlaying(&isPlaying);
        if (isPlaying)
        {
            m_channel->stop();
        }
        m_channel = nullptr;
    }

    if (m_state != PlaybackState::Stopped)
    {
        SetState(PlaybackState::Stopped);
        NotifyPositionChanged(0);
    }
    return true;
}

bool FmodPlaybackEngine::Seek(std::int64_t positionMs)
{
    if (!m_channel)
    {
        return false;
    }

    const std::int64_t clamped = std::clamp<std::int64_t>(positionMs, 0, m_durationMs);
    if (!Check(m_channel->setPosition(static_cast<unsigned int>(clamped), FMOD_TIMEUNIT_MS), "setPosition"))
    {
        return false;
    }

    NotifyPositionChanged(clamped);
    return true;
}

void FmodPlaybackEngine::SetVolume(int volume)
{
    m_volume = std::clamp(volume, 0, 100);

    if (m_channel)
    {
        Check(m_channel->setVolume(m_volume / 100.0f), "setVolume");
    }
}

void FmodPlaybackEngine::Update(float deltaTime)
{
    if (!m_system)
    {
        return;
    }

    FMOD_RESULT result = m_system->update();
    if (result != FMOD_OK)
    {
        spdlog::error("FMOD update failed: {}", FMOD_ErrorString(result));
    }

    if (m_state != PlaybackState::Playing || !m_channel)
    {
        return;
    }

    bool isPlaying = false;
    result = m_channel->isPlaying(&isPlaying);
    if (result == FMOD_ERR_INVALID_HANDLE || result == FMOD_ERR_CHANNEL_STOLEN || (result == FMOD_OK && !isPlaying))
    {
        m_channel = nullptr;
        SetState(PlaybackState::Stopped);
        NotifyPositionChanged(m_durationMs);
        spdlog::debug("End of media: {}", FileNameOf(m_filePath));
        NotifyEndOfMedia();
        return;
    }

    m_positionTimer += deltaTime;
    if (m_positionTimer >= kPositionInterval)
    {
        m_positionTimer = 0.0f;
        NotifyPositionChanged(GetPosition());
    }
}

std::int64_t FmodPlaybackEngine::GetPosition() const
{
    if (!m_channel)
    {
        return 0;
    }

    unsigned int position = 0;
    if (m_channel->getPosition(&position, FMOD_TIMEUNIT_MS) != FMOD_OK)
    {
        return 0;
    }
    return static_cast<std::int64_t>(position);
}

void FmodPlaybackEngine::UnloadSound()
{
    if (m_channel)
    {
        m_channel->stop();
        m_channel = nullptr;
    }

    if (m_sound)
    {
        FMOD_RESULT result = m_sound->release();
        if (result != FMOD_OK)
        {
            spdlog::error("Failed to release sound {}: {}", m_filePath, FMOD_ErrorString(result));
        }
        m_sound = nullptr;
    }

    m_durationMs = 0;
    m_filePath.clear();
}

void FmodPlaybackEngine::SetState(PlaybackState state)
{
    if (m_state == state)
    {
        return;
    }

    m_state = state;
    NotifyStateChanged(state);
}

bool FmodPlaybackEngine::Check(FMOD_RESULT result, const char* what)
{
    if (result == FMOD_OK)
    {
        return true;
    }

    spdlog::error("FMOD {} failed: {}", what, FMOD_ErrorString(result));
    NotifyError(std::string(what) + ": " + FMOD_ErrorString(result));
    return false;
}

Metadata FmodPlaybackEngine::ReadTags()
{
    Metadata tags;
    if (!m_sound)
    {
        return tags;
    }

    int numTags = 0;
    if (m_sound->getNumTags(&numTags, nullptr) != FMOD_OK || numTags == 0)
    {
        return tags;
    }

    for (const auto& mapping : kTagMappings)
    {
        if (tags.count(mapping.key))
        {
            continue;
        }

        FMOD_TAG tag;
        if (m_sound->getTag(mapping.tagName, 0, &tag) != FMOD_OK)
        {
            continue;
        }

        if ((tag.datatype == FMOD_TAGDATATYPE_STRING || tag.datatype == FMOD_TAGDATATYPE_STRING_UTF8)
            && tag.data && tag.datalen > 0)
        {
            const char* text = static_cast<const char*>(tag.data);
            std::string value(text, strnlen(text, tag.datalen));
            if (!value.empty())
            {
                tags[mapping.key] = value;
            }
        }
    }

    if (m_durationMs > 0)
    {
        tags[MetadataKeys::Duration] = m_durationMs;
    }

    return tags;
}

} // namespace RW
