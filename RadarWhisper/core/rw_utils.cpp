// rw_utils.cpp

#include "rw_utils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace RW
{

std::string GenerateUuid()
{
    static std::mt19937_64 rng(std::random_device{}());

    std::uint64_t high = rng();
    std::uint64_t low = rng();

    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return out.str();
}

std::string CurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return out.str();
}

std::string FormatDuration(std::int64_t seconds)
{
    if (seconds < 0)
    {
        seconds = 0;
    }

    std::int64_t hours = seconds / 3600;
    std::int64_t minutes = (seconds % 3600) / 60;
    std::int64_t secs = seconds % 60;

    std::ostringstream out;
    if (hours > 0)
    {
        out << hours << ':' << std::setw(2) << std::setfill('0') << minutes
            << ':' << std::setw(2) << std::setfill('0') << secs;
    }
    else
    {
        out << minutes << ':' << std::setw(2) << std::setfill('0') << secs;
    }
    return out.str();
}

std::optional<std::int64_t> TruncateToInt64(double value)
{
    // -2^63 and 2^63 are exact doubles; the upper bound is exclusive.
    constexpr double lower = static_cast<double>(std::numeric_limits<std::int64_t>::min());
    constexpr double upper = -lower;

    if (!std::isfinite(value))
    {
        return std::nullopt;
    }

    const double whole = std::trunc(value);
    if (whole < lower || whole >= upper)
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(whole);
}

std::optional<std::int64_t> SecondsToMilliseconds(double seconds)
{
    auto whole = TruncateToInt64(seconds);
    if (!whole || *whole < 0 || *whole > std::numeric_limits<std::int64_t>::max() / 1000)
    {
        return std::nullopt;
    }
    return *whole * 1000;
}

std::string ToLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Trim(const std::string& text)
{
    auto begin = std::find_if_not(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    return (begin < end) ? std::string(begin, end) : std::string();
}

bool StartsWith(const std::string& text, const std::string& prefix)
{
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string FileNameOf(const std::string& path)
{
    return std::filesystem::path(path).filename().string();
}

std::string FileStemOf(const std::string& path)
{
    return std::filesystem::path(path).stem().string();
}

} // namespace RW
