// rw_taglib_metadata.cpp

#include "rw_taglib_metadata.h"
#include "rw_errors.h"
#include "rw_utils.h"

#include <algorithm>
#include <filesystem>
#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/audioproperties.h>
#include <taglib/tstring.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace RW
{

namespace
{
    std::string ToUtf8(const TagLib::String& text)
    {
        return text.to8Bit(true);
    }

    TagLib::String FromUtf8(const std::string& text)
    {
        return TagLib::String(text, TagLib::String::UTF8);
    }

    std::string ExtensionOf(const std::string& filePath)
    {
        return ToLower(fs::path(filePath).extension().string());
    }
}

const std::vector<std::string>& TagLibMetadataProvider::SupportedExtensions()
{
    static const std::vector<std::string> extensions = { ".mp3", ".flac", ".wav", ".m4a", ".ogg" };
    return extensions;
}

bool TagLibMetadataProvider::IsSupported(const std::string& filePath)
{
    const auto& extensions = SupportedExtensions();
    return std::find(extensions.begin(), extensions.end(), ExtensionOf(filePath)) != extensions.end();
}

Metadata TagLibMetadataProvider::GetMetadata(const std::string& filePath)
{
    std::error_code ec;
    if (!fs::exists(filePath, ec))
    {
        throw PlaylistError(ErrorKind::NotFound, "File not found: " + filePath);
    }

    const std::string extension = ExtensionOf(filePath);
    if (!IsSupported(filePath))
    {
        throw PlaylistError(ErrorKind::UnsupportedFormat, "Unsupported file format: " + extension);
    }

    Metadata metadata;
    metadata["file_name"] = FileNameOf(filePath);
    const auto fileSize = fs::file_size(filePath, ec);
    metadata["file_size"] = static_cast<std::int64_t>(ec ? 0 : fileSize);
    metadata["file_extension"] = extension.substr(1);

    TagLib::FileRef file(filePath.c_str());
    if (file.isNull())
    {
        spdlog::warn("TagLib could not read '{}', using file name as title.", filePath);
        metadata[MetadataKeys::Title] = FileStemOf(filePath);
        return metadata;
    }

    if (TagLib::Tag* tag = file.tag())
    {
        const std::string title = ToUtf8(tag->title());
        metadata[MetadataKeys::Title] = title.empty() ? FileStemOf(filePath) : title;
        metadata[MetadataKeys::Artist] = ToUtf8(tag->artist());
        metadata[MetadataKeys::Album] = ToUtf8(tag->album());
        metadata["genre"] = ToUtf8(tag->genre());
        metadata["year"] = static_cast<std::int64_t>(tag->year());
        metadata["track_number"] = static_cast<std::int64_t>(tag->track());
    }
    else
    {
        metadata[MetadataKeys::Title] = FileStemOf(filePath);
    }

    if (TagLib::AudioProperties* properties = file.audioProperties())
    {
        const std::int64_t durationMs = properties->lengthInMilliseconds();
        metadata[MetadataKeys::Duration] = durationMs;
        metadata["duration_str"] = FormatDuration(durationMs / 1000);
        metadata["bitrate"] = static_cast<std::int64_t>(properties->bitrate());
        metadata["sample_rate"] = static_cast<std::int64_t>(properties->sampleRate());
        metadata["channels"] = static_cast<std::int64_t>(properties->channels());
    }

    return metadata;
}

bool TagLibMetadataProvider::UpdateTags(const std::string& filePath, const Metadata& tags)
{
    if (!IsSupported(filePath))
    {
        throw PlaylistError(ErrorKind::UnsupportedFormat, "Unsupported file format: " + ExtensionOf(filePath));
    }

    TagLib::FileRef file(filePath.c_str());
    if (file.isNull() || !file.tag())
    {
        spdlog::error("Cannot open '{}' for tag update.", filePath);
        return false;
    }

    TagLib::Tag* tag = file.tag();

    if (auto title = GetMetadataString(tags, MetadataKeys::Title))
        tag->setTitle(FromUtf8(*title));
    if (auto artist = GetMetadataString(tags, MetadataKeys::Artist))
        tag->setArtist(FromUtf8(*artist));
    if (auto album = GetMetadataString(tags, MetadataKeys::Album))
        tag->setAlbum(FromUtf8(*album));
    if (auto genre = GetMetadataString(tags, "genre"))
        tag->setGenre(FromUtf8(*genre));
    if (auto year = GetMetadataInt(tags, "year"))
        tag->setYear(static_cast<unsigned int>(*year));
    if (auto trackNumber = GetMetadataInt(tags, "track_number"))
        tag->setTrack(static_cast<unsigned int>(*trackNumber));

    if (!file.save())
    {
        spdlog::error("Failed to save tags of '{}'.", filePath);
        return false;
    }

    spdlog::info("Tags updated for '{}'.", FileNameOf(filePath));
    return true;
}

} // namespace RW
