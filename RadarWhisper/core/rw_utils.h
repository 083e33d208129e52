// rw_utils.h

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace RW
{

// Random 128-bit identifier in the canonical 8-4-4-4-12 hex form (version 4 layout).
std::string GenerateUuid();

// Local time as ISO-8601 with microseconds, e.g. 2024-05-01T21:14:03.512004
std::string CurrentTimestamp();

// H:MM:SS when at least an hour long, M:SS otherwise.
std::string FormatDuration(std::int64_t seconds);

// Truncated toward zero; nullopt for NaN, infinities and values outside int64.
std::optional<std::int64_t> TruncateToInt64(double value);

// Whole seconds as milliseconds; nullopt when negative, not finite or too large to represent.
std::optional<std::int64_t> SecondsToMilliseconds(double seconds);

std::string ToLower(std::string text);
std::string Trim(const std::string& text);
bool StartsWith(const std::string& text, const std::string& prefix);

std::string FileNameOf(const std::string& path);
std::string FileStemOf(const std::string& path);

} // namespace RW
