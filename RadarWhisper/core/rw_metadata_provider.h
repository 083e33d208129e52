// rw_metadata_provider.h

#pragma once

#include "rw_track.h"

#include <string>

namespace RW
{

// Tag reader used when tracks are added. Implementations throw
// PlaylistError (NotFound, UnsupportedFormat) when a file cannot be read.
class MetadataProvider
{
public:
    virtual ~MetadataProvider() = default;

    virtual Metadata GetMetadata(const std::string& filePath) = 0;
    virtual bool UpdateTags(const std::string& filePath, const Metadata& tags) = 0;
};

} // namespace RW
