#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy of the copy engine.
 *
 * Every fatal condition is a `BmapError` subclass carrying an `ErrorInfo`. The info
 * travels across the reader/writer channel as plain data, and `throw_error()` rebuilds
 * the concrete exception type on the consuming side.
 *
 * @code
 * FormatError
 *   ├── InconsistentMetadataError
 *   ├── UnsupportedVersionError
 *   └── InvalidRangeError
 * ChecksumMismatchError
 * IOError
 * CapacityError
 * InconsistentBmapError
 * RestoreError
 * @endcode
 *
 * `TuningWarning` is not an exception; tuners record it and log it.
 */
#include "bmapcopy_core_export.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace bmapcopy::bmap
{

enum class ErrorKind
{
    Format,
    InconsistentMetadata,
    UnsupportedVersion,
    InvalidRange,
    ChecksumMismatch,
    IO,
    Capacity,
    InconsistentBmap,
    Restore
};

/** @brief Stable name of an ErrorKind, for logs and test diagnostics. */
BMAPCOPY_CORE_EXPORT const char *to_string(ErrorKind kind) noexcept;

/**
 * @brief Structured context of a fatal error.
 *
 * `path` names the offending file when there is one; `first_block`/`last_block`
 * the affected block range; `sys_errno` the OS error for I/O failures.
 */
struct ErrorInfo
{
    ErrorKind kind = ErrorKind::IO;
    std::string message;
    std::string path;
    std::optional<uint64_t> first_block;
    std::optional<uint64_t> last_block;
    int sys_errno = 0;
};

class BMAPCOPY_CORE_EXPORT BmapError : public std::runtime_error
{
  public:
    explicit BmapError(ErrorInfo info);

    [[nodiscard]] const ErrorInfo &info() const noexcept { return m_info; }
    [[nodiscard]] ErrorKind kind() const noexcept { return m_info.kind; }

  private:
    ErrorInfo m_info;
};

class BMAPCOPY_CORE_EXPORT FormatError : public BmapError
{
  public:
    using BmapError::BmapError;
};

class BMAPCOPY_CORE_EXPORT InconsistentMetadataError : public FormatError
{
  public:
    using FormatError::FormatError;
};

class BMAPCOPY_CORE_EXPORT UnsupportedVersionError : public FormatError
{
  public:
    using FormatError::FormatError;
};

class BMAPCOPY_CORE_EXPORT InvalidRangeError : public FormatError
{
  public:
    using FormatError::FormatError;
};

class BMAPCOPY_CORE_EXPORT ChecksumMismatchError : public BmapError
{
  public:
    using BmapError::BmapError;
};

class BMAPCOPY_CORE_EXPORT IOError : public BmapError
{
  public:
    using BmapError::BmapError;
};

class BMAPCOPY_CORE_EXPORT CapacityError : public BmapError
{
  public:
    using BmapError::BmapError;
};

class BMAPCOPY_CORE_EXPORT InconsistentBmapError : public BmapError
{
  public:
    using BmapError::BmapError;
};

class BMAPCOPY_CORE_EXPORT RestoreError : public BmapError
{
  public:
    using BmapError::BmapError;
};

/**
 * @brief Non-fatal note from a best-effort operation (device tuning).
 */
struct TuningWarning
{
    std::string path;
    std::string message;
};

/**
 * @brief Throws the exception type that matches `info.kind`.
 */
[[noreturn]] BMAPCOPY_CORE_EXPORT void throw_error(ErrorInfo info);

/** @brief Shorthand for an IOError with path and errno. */
[[noreturn]] BMAPCOPY_CORE_EXPORT void throw_io_error(std::string message, std::string path,
                                                      int sys_errno);

} // namespace bmapcopy::bmap
