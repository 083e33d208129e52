// rw_sequencer.h

#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace RW
{

enum class RepeatMode
{
    NoRepeat,
    RepeatPlaylist,
    RepeatTrack
};

const char* RepeatModeToString(RepeatMode mode);
std::optional<RepeatMode> RepeatModeFromString(const std::string& text);

// Next/previous resolution under shuffle and repeat policies. Holds the
// current track index and the shuffle order of the current playlist; the
// owner reports every track list mutation so both stay valid.
class Sequencer
{
public:
    Sequencer();
    explicit Sequencer(std::uint32_t seed);

    // Both return the resolved index, or -1 when playback cannot move.
    // RepeatTrack with a selected track returns that track at any position, not only at the ends.
    int Next(size_t trackCount);
    int Previous(size_t trackCount);

    void SetShuffleEnabled(bool enabled, size_t trackCount);
    bool IsShuffleEnabled() const { return m_shuffleEnabled; }

    void SetRepeatMode(RepeatMode mode) { m_repeatMode = mode; }
    RepeatMode GetRepeatMode() const { return m_repeatMode; }

    int GetCurrentIndex() const { return m_currentIndex; }
    void SetCurrentIndex(int index);

    const std::vector<int>& GetShuffleOrder() const { return m_shuffleOrder; }
    int GetShuffleCursor() const { return m_shuffleCursor; }

    void GenerateShuffleOrder(size_t trackCount);

    // Drops the selection and the shuffle order.
    void Reset();

    // Track list fix-ups. The bool results report a change of the current index.
    bool OnTrackRemoved(int index);
    bool OnTrackMoved(int fromIndex, int toIndex);
    void OnTracksAppended(size_t previousCount, size_t newCount);
    void OnTracksCleared();

private:
    int NextShuffleIndex(size_t trackCount);
    std::vector<int> RandomPermutation(size_t trackCount);

    bool m_shuffleEnabled = false;
    RepeatMode m_repeatMode = RepeatMode::NoRepeat;

    int m_currentIndex = -1;
    std::vector<int> m_shuffleOrder;
    int m_shuffleCursor = -1;

    std::mt19937 m_rng;
};

} // namespace RW
