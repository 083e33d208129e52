// rw_sequencer.cpp

#include "rw_sequencer.h"
#include "rw_utils.h"

#include <algorithm>
#include <numeric>
#include <spdlog/spdlog.h>

namespace RW
{

const char* RepeatModeToString(RepeatMode mode)
{
    switch (mode)
    {
    case RepeatMode::NoRepeat:       return "none";
    case RepeatMode::RepeatPlaylist: return "playlist";
    case RepeatMode::RepeatTrack:    return "track";
    }
    return "none";
}

std::optional<RepeatMode> RepeatModeFromString(const std::string& text)
{
    const std::string mode = ToLower(Trim(text));
    if (mode == "none" || mode == "off")
        return RepeatMode::NoRepeat;
    if (mode == "playlist" || mode == "all")
        return RepeatMode::RepeatPlaylist;
    if (mode == "track" || mode == "one")
        return RepeatMode::RepeatTrack;
    return std::nullopt;
}

Sequencer::Sequencer()
    : m_rng(std::random_device{}())
{
}

Sequencer::Sequencer(std::uint32_t seed)
    : m_rng(seed)
{
}

int Sequencer::Next(size_t trackCount)
{
    const int count = static_cast<int>(trackCount);
    if (count == 0)
    {
        return -1;
    }

    if (m_repeatMode == RepeatMode::RepeatTrack && m_currentIndex >= 0 && m_currentIndex < count)
    {
        return m_currentIndex;
    }

    int nextIndex = -1;
    if (m_shuffleEnabled)
    {
        nextIndex = NextShuffleIndex(trackCount);
    }
    else
    {
        nextIndex = m_currentIndex + 1;
        if (nextIndex >= count)
        {
            if (m_repeatMode != RepeatMode::RepeatPlaylist)
            {
                return -1;
            }
            nextIndex = 0;
        }
    }

    if (nextIndex < 0 || nextIndex >= count)
    {
        return -1;
    }

    m_currentIndex = nextIndex;
    return nextIndex;
}

int Sequencer::Previous(size_t trackCount)
{
    const int count = static_cast<int>(trackCount);
    if (count == 0)
    {
        return -1;
    }

    if (m_repeatMode == RepeatMode::RepeatTrack && m_currentIndex >= 0 && m_currentIndex < count)
    {
        return m_currentIndex;
    }

    int previousIndex = -1;
    if (m_shuffleEnabled)
    {
        if (m_shuffleCursor > 0)
        {
            --m_shuffleCursor;
            previousIndex = m_shuffleOrder[m_shuffleCursor];
        }
        else if (m_repeatMode == RepeatMode::RepeatPlaylist && !m_shuffleOrder.empty())
        {
            m_shuffleCursor = static_cast<int>(m_shuffleOrder.size()) - 1;
            previousIndex = m_shuffleOrder[m_shuffleCursor];
        }
        else
        {
            previousIndex = m_currentIndex;
        }
    }
    else
    {
        previousIndex = m_currentIndex - 1;
        if (previousIndex < 0)
        {
            if (m_repeatMode != RepeatMode::RepeatPlaylist)
            {
                return -1;
            }
            previousIndex = count - 1;
        }
    }

    if (previousIndex < 0 || previousIndex >= count)
    {
        return -1;
    }

    m_currentIndex = previousIndex;
    return previousIndex;
}

void Sequencer::SetShuffleEnabled(bool enabled, size_t trackCount)
{
    if (m_shuffleEnabled == enabled)
    {
        return;
    }

    m_shuffleEnabled = enabled;
    if (enabled)
    {
        GenerateShuffleOrder(trackCount);
    }
    else
    {
        m_shuffleOrder.clear();
        m_shuffleCursor = -1;
    }
}

void Sequencer::SetCurrentIndex(int index)
{
    m_currentIndex = index;

    auto it = std::find(m_shuffleOrder.begin(), m_shuffleOrder.end(), index);
    m_shuffleCursor = (it != m_shuffleOrder.end())
        ? static_cast<int>(it - m_shuffleOrder.begin())
        : -1;
}

void Sequencer::GenerateShuffleOrder(size_t trackCount)
{
    if (trackCount == 0)
    {
        m_shuffleOrder.clear();
        m_shuffleCursor = -1;
        return;
    }

    if (m_currentIndex >= 0 && m_currentIndex < static_cast<int>(trackCount))
    {
        std::vector<int> rest;
        rest.reserve(trackCount - 1);
        for (int i = 0; i < static_cast<int>(trackCount); ++i)
        {
            if (i != m_currentIndex)
                rest.push_back(i);
        }
        std::shuffle(rest.begin(), rest.end(), m_rng);

        m_shuffleOrder.clear();
        m_shuffleOrder.push_back(m_currentIndex);
        m_shuffleOrder.insert(m_shuffleOrder.end(), rest.begin(), rest.end());
        m_shuffleCursor = 0;
    }
    else
    {
        m_shuffleOrder = RandomPermutation(trackCount);
        m_shuffleCursor = -1;
    }

    spdlog::debug("Shuffle order generated for {} tracks.", trackCount);
}

void Sequencer::Reset()
{
    m_currentIndex = -1;
    m_shuffleOrder.clear();
    m_shuffleCursor = -1;
}

bool Sequencer::OnTrackRemoved(int index)
{
    bool currentChanged = false;
    if (index == m_currentIndex)
    {
        m_currentIndex = -1;
        currentChanged = true;
    }
    else if (index < m_currentIndex)
    {
        --m_currentIndex;
        currentChanged = true;
    }

    auto it = std::find(m_shuffleOrder.begin(), m_shuffleOrder.end(), index);
    if (it != m_shuffleOrder.end())
    {
        const int position = static_cast<int>(it - m_shuffleOrder.begin());
        m_shuffleOrder.erase(it);

        // The cursor points at the last entry played; stepping back onto the
        // removed slot makes the following entry come up next.
        if (position <= m_shuffleCursor)
        {
            --m_shuffleCursor;
        }
    }

    for (auto& entry : m_shuffleOrder)
    {
        if (entry > index)
            --entry;
    }

    return currentChanged;
}

bool Sequencer::OnTrackMoved(int fromIndex, int toIndex)
{
    if (fromIndex == toIndex)
    {
        return false;
    }

    auto remap = [fromIndex, toIndex](int index)
    {
        if (index == fromIndex)
            return toIndex;
        if (fromIndex < toIndex && index > fromIndex && index <= toIndex)
            return index - 1;
        if (toIndex < fromIndex && index >= toIndex && index < fromIndex)
            return index + 1;
        return index;
    };

    for (auto& entry : m_shuffleOrder)
    {
        entry = remap(entry);
    }

    if (m_currentIndex < 0)
    {
        return false;
    }

    const int remapped = remap(m_currentIndex);
    const bool currentChanged = (remapped != m_currentIndex);
    m_currentIndex = remapped;
    return currentChanged;
}

void Sequencer::OnTracksAppended(size_t previousCount, size_t newCount)
{
    if (m_shuffleOrder.empty() || newCount <= previousCount)
    {
        return;
    }

    const auto firstNew = m_shuffleOrder.size();
    for (size_t i = previousCount; i < newCount; ++i)
    {
        m_shuffleOrder.push_back(static_cast<int>(i));
    }
    std::shuffle(m_shuffleOrder.begin() + firstNew, m_shuffleOrder.end(), m_rng);
}

void Sequencer::OnTracksCleared()
{
    Reset();
}

int Sequencer::NextShuffleIndex(size_t trackCount)
{
    if (m_shuffleOrder.empty())
    {
        GenerateShuffleOrder(trackCount);
        if (m_shuffleOrder.empty())
        {
            return -1;
        }
    }

    if (m_shuffleCursor < 0)
    {
        m_shuffleCursor = 0;
        return m_shuffleOrder[0];
    }

    ++m_shuffleCursor;
    if (m_shuffleCursor < static_cast<int>(m_shuffleOrder.size()))
    {
        return m_shuffleOrder[m_shuffleCursor];
    }

    switch (m_repeatMode)
    {
    case RepeatMode::RepeatPlaylist:
    {
        // Fresh pass; avoid opening it with the track that closed the last one.
        m_shuffleOrder = RandomPermutation(trackCount);
        if (m_shuffleOrder.size() > 1 && m_shuffleOrder.front() == m_currentIndex)
        {
            std::swap(m_shuffleOrder.front(), m_shuffleOrder.back());
        }
        m_shuffleCursor = 0;
        return m_shuffleOrder[0];
    }
    case RepeatMode::RepeatTrack:
        --m_shuffleCursor;
        return m_shuffleOrder[m_shuffleCursor];
    case RepeatMode::NoRepeat:
        break;
    }

    m_shuffleCursor = static_cast<int>(m_shuffleOrder.size()) - 1;
    return -1;
}

std::vector<int> Sequencer::RandomPermutation(size_t trackCount)
{
    std::vector<int> order(trackCount);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), m_rng);
    return order;
}

} // namespace RW
