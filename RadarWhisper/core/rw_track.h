// rw_track.h

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace RW
{

using MetadataValue = std::variant<std::string, std::int64_t, double>;
using Metadata = std::map<std::string, MetadataValue>;

namespace MetadataKeys
{
    constexpr const char* Title    = "title";
    constexpr const char* Artist   = "artist";
    constexpr const char* Album    = "album";
    constexpr const char* Duration = "duration"; // milliseconds
}

std::optional<std::string> GetMetadataString(const Metadata& metadata, const std::string& key);
std::optional<std::int64_t> GetMetadataInt(const Metadata& metadata, const std::string& key);

class Track
{
public:
    explicit Track(std::string filePath, Metadata metadata = {});
    Track(std::string filePath, std::string id, Metadata metadata);

    const std::string& GetFilePath() const { return m_filePath; }
    const std::string& GetId() const { return m_id; }

    const Metadata& GetMetadata() const { return m_metadata; }
    Metadata& GetMetadata() { return m_metadata; }
    void SetMetadata(Metadata metadata) { m_metadata = std::move(metadata); }

    std::optional<std::string> GetTitle() const;
    std::optional<std::string> GetArtist() const;
    std::optional<std::string> GetAlbum() const;
    std::optional<std::int64_t> GetDurationMs() const;

    // Title if known, file name otherwise.
    std::string GetDisplayTitle() const;

    bool operator==(const Track& other) const { return m_id == other.m_id; }
    bool operator!=(const Track& other) const { return !(*this == other); }

private:
    std::string m_filePath;
    std::string m_id;
    Metadata m_metadata;
};

} // namespace RW
