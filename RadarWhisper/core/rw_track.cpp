// rw_track.cpp

#include "rw_track.h"
#include "rw_utils.h"

namespace RW
{

std::optional<std::string> GetMetadataString(const Metadata& metadata, const std::string& key)
{
    auto it = metadata.find(key);
    if (it == metadata.end())
    {
        return std::nullopt;
    }

    if (const auto* text = std::get_if<std::string>(&it->second))
    {
        return *text;
    }
    if (const auto* number = std::get_if<std::int64_t>(&it->second))
    {
        return std::to_string(*number);
    }
    return std::to_string(std::get<double>(it->second));
}

std::optional<std::int64_t> GetMetadataInt(const Metadata& metadata, const std::string& key)
{
    auto it = metadata.find(key);
    if (it == metadata.end())
    {
        return std::nullopt;
    }

    if (const auto* number = std::get_if<std::int64_t>(&it->second))
    {
        return *number;
    }
    if (const auto* real = std::get_if<double>(&it->second))
    {
        return TruncateToInt64(*real);
    }
    return std::nullopt;
}

Track::Track(std::string filePath, Metadata metadata)
    : m_filePath(std::move(filePath))
    , m_id(GenerateUuid())
    , m_metadata(std::move(metadata))
{
}

Track::Track(std::string filePath, std::string id, Metadata metadata)
    : m_filePath(std::move(filePath))
    , m_id(id.empty() ? GenerateUuid() : std::move(id))
    , m_metadata(std::move(metadata))
{
}

std::optional<std::string> Track::GetTitle() const
{
    return GetMetadataString(m_metadata, MetadataKeys::Title);
}

std::optional<std::string> Track::GetArtist() const
{
    return GetMetadataString(m_metadata, MetadataKeys::Artist);
}

std::optional<std::string> Track::GetAlbum() const
{
    return GetMetadataString(m_metadata, MetadataKeys::Album);
}

std::optional<std::int64_t> Track::GetDurationMs() const
{
    return GetMetadataInt(m_metadata, MetadataKeys::Duration);
}

std::string Track::GetDisplayTitle() const
{
    auto title = GetTitle();
    if (title && !title->empty())
    {
        return *title;
    }
    return FileNameOf(m_filePath);
}

} // namespace RW
