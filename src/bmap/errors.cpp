#include "bmap/errors.hpp"

#include <utility>

namespace bmapcopy::bmap
{

const char *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::Format:
        return "FormatError";
    case ErrorKind::InconsistentMetadata:
        return "InconsistentMetadataError";
    case ErrorKind::UnsupportedVersion:
        return "UnsupportedVersionError";
    case ErrorKind::InvalidRange:
        return "InvalidRangeError";
    case ErrorKind::ChecksumMismatch:
        return "ChecksumMismatchError";
    case ErrorKind::IO:
        return "IOError";
    case ErrorKind::Capacity:
        return "CapacityError";
    case ErrorKind::InconsistentBmap:
        return "InconsistentBmapError";
    case ErrorKind::Restore:
        return "RestoreError";
    }
    return "UnknownError";
}

BmapError::BmapError(ErrorInfo info) : std::runtime_error(info.message), m_info(std::move(info))
{
}

void throw_error(ErrorInfo info)
{
    switch (info.kind)
    {
    case ErrorKind::Format:
        throw FormatError(std::move(info));
    case ErrorKind::InconsistentMetadata:
        throw InconsistentMetadataError(std::move(info));
    case ErrorKind::UnsupportedVersion:
        throw UnsupportedVersionError(std::move(info));
    case ErrorKind::InvalidRange:
        throw InvalidRangeError(std::move(info));
    case ErrorKind::ChecksumMismatch:
        throw ChecksumMismatchError(std::move(info));
    case ErrorKind::IO:
        throw IOError(std::move(info));
    case ErrorKind::Capacity:
        throw CapacityError(std::move(info));
    case ErrorKind::InconsistentBmap:
        throw InconsistentBmapError(std::move(info));
    case ErrorKind::Restore:
        throw RestoreError(std::move(info));
    }
    throw BmapError(std::move(info));
}

void throw_io_error(std::string message, std::string path, int sys_errno)
{
    ErrorInfo info;
    info.kind = ErrorKind::IO;
    info.message = std::move(message);
    info.path = std::move(path);
    info.sys_errno = sys_errno;
    throw IOError(std::move(info));
}

} // namespace bmapcopy::bmap
