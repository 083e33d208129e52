// rw_errors.h

#pragma once

#include <stdexcept>
#include <string>

namespace RW
{

enum class ErrorKind
{
    NotFound,
    UnsupportedFormat,
    ParseFailure,
    IOFailure
};

inline const char* ErrorKindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NotFound:          return "NotFound";
    case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
    case ErrorKind::ParseFailure:      return "ParseFailure";
    case ErrorKind::IOFailure:         return "IOFailure";
    }
    return "Unknown";
}

class PlaylistError : public std::runtime_error
{
public:
    PlaylistError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind GetKind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace RW
