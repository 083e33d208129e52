// rw_taglib_metadata.h
#pragma once

#include "rw_metadata_provider.h"

#include <string>
#include <vector>

namespace RW
{

// Reads and writes tags of .mp3 .flac .wav .m4a .ogg files with TagLib.
class TagLibMetadataProvider : public MetadataProvider
{
public:
    static const std::vector<std::string>& SupportedExtensions();
    static bool IsSupported(const std::string& filePath);

    Metadata GetMetadata(const std::string& filePath) override;
    bool UpdateTags(const std::string& filePath, const Metadata& tags) override;
};

} // namespace RW
