/**
 * @file image_io.cpp
 * @brief POSIX file-descriptor implementations of ImageSource and Destination.
 */
#include "bmc_service.hpp"
#include "bmap/errors.hpp"
#include "bmap/image_io.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <sys/types.h>
#include <unistd.h>

namespace bmapcopy::bmap
{

namespace
{
std::string errno_text(int err)
{
    return std::strerror(err);
}
} // namespace

const char *to_string(DestinationKind kind) noexcept
{
    switch (kind)
    {
    case DestinationKind::RegularFile:
        return "regular file";
    case DestinationKind::BlockDevice:
        return "block device";
    case DestinationKind::CharDevice:
        return "character device";
    }
    return "unknown";
}

// ============================================================================
// FileImageSource
// ============================================================================

FileImageSource::FileImageSource(const std::filesystem::path &path) : m_path(path.string())
{
    if (m_path == "-")
    {
        m_fd = STDIN_FILENO;
        m_owns_fd = false;
    }
    else
    {
        m_fd = ::open(m_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (m_fd == -1)
        {
            const int err = errno;
            throw_io_error(fmt::format("cannot open image file '{}': {}", m_path, errno_text(err)),
                           m_path, err);
        }
    }

    struct stat st{};
    if (::fstat(m_fd, &st) == 0 && S_ISREG(st.st_mode))
    {
        m_size = static_cast<uint64_t>(st.st_size);
    }
    if (::lseek(m_fd, 0, SEEK_CUR) == -1 && errno == ESPIPE)
    {
        m_seekable = false;
        LOGGER_DEBUG("[image] '{}' is not seekable, reading sequentially", m_path);
    }
}

FileImageSource::~FileImageSource()
{
    if (m_fd != -1 && m_owns_fd)
    {
        ::close(m_fd);
    }
}

size_t FileImageSource::read_fully(void *buf, size_t len)
{
    auto *out = static_cast<uint8_t *>(buf);
    size_t total = 0;
    while (total < len)
    {
        const ssize_t n = ::read(m_fd, out + total, len - total);
        if (n == 0)
        {
            break;
        }
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            const int err = errno;
            throw_io_error(fmt::format("error reading image file '{}': {}", m_path,
                                       errno_text(err)),
                           m_path, err);
        }
        total += static_cast<size_t>(n);
    }
    m_stream_pos += total;
    return total;
}

size_t FileImageSource::read_at(uint64_t offset, void *buf, size_t len)
{
    if (!m_seekable)
    {
        if (offset < m_stream_pos)
        {
            throw_io_error(fmt::format("cannot seek backwards in non-seekable image '{}' (from {} "
                                       "to {})",
                                       m_path, m_stream_pos, offset),
                           m_path, ESPIPE);
        }
        constexpr uint64_t kSkipChunk = 1024 * 1024;
        std::vector<uint8_t> scratch;
        while (m_stream_pos < offset)
        {
            const uint64_t gap = offset - m_stream_pos;
            scratch.resize(static_cast<size_t>(gap < kSkipChunk ? gap : kSkipChunk));
            if (read_fully(scratch.data(), scratch.size()) < scratch.size())
            {
                return 0;
            }
        }
        return read_fully(buf, len);
    }

    auto *out = static_cast<uint8_t *>(buf);
    size_t total = 0;
    while (total < len)
    {
        const ssize_t n =
            ::pread(m_fd, out + total, len - total, static_cast<off_t>(offset + total));
        if (n == 0)
        {
            break;
        }
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            const int err = errno;
            throw_io_error(fmt::format("error reading image file '{}' at offset {}: {}", m_path,
                                       offset + total, errno_text(err)),
                           m_path, err);
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

// ============================================================================
// FileDestination
// ============================================================================

FileDestination::FileDestination(const std::filesystem::path &path) : m_path(path.string())
{
    struct stat st{};
    int flags = O_WRONLY | O_CLOEXEC;
    if (::stat(m_path.c_str(), &st) == 0)
    {
        if (S_ISBLK(st.st_mode))
        {
            m_kind = DestinationKind::BlockDevice;
            // O_EXCL on a block device fails if it is mounted.
            flags |= O_EXCL;
        }
        else if (S_ISCHR(st.st_mode))
        {
            m_kind = DestinationKind::CharDevice;
        }
        else
        {
            flags |= O_CREAT | O_TRUNC;
        }
        if (m_kind != DestinationKind::RegularFile)
        {
            m_device_id = std::make_pair(static_cast<unsigned>(major(st.st_rdev)),
                                         static_cast<unsigned>(minor(st.st_rdev)));
        }
    }
    else
    {
        flags |= O_CREAT | O_TRUNC;
    }

    m_fd = ::open(m_path.c_str(), flags, 0644);
    if (m_fd == -1)
    {
        const int err = errno;
        throw_io_error(fmt::format("cannot open destination file '{}': {}", m_path,
                                   errno_text(err)),
                       m_path, err);
    }
    LOGGER_DEBUG("[dest] opened '{}' as a {}", m_path, to_string(m_kind));
}

FileDestination::~FileDestination()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
    }
}

void FileDestination::write_at(uint64_t offset, const void *data, size_t len)
{
    const auto *in = static_cast<const uint8_t *>(data);
    size_t total = 0;
    while (total < len)
    {
        const ssize_t n =
            m_kind == DestinationKind::CharDevice
                ? ::write(m_fd, in + total, len - total)
                : ::pwrite(m_fd, in + total, len - total, static_cast<off_t>(offset + total));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            const int err = errno;
            throw_io_error(fmt::format("error while writing to '{}' at offset {}: {}", m_path,
                                       offset + total, errno_text(err)),
                           m_path, err);
        }
        if (n == 0)
        {
            throw_io_error(fmt::format("short write to '{}' at offset {}", m_path, offset + total),
                           m_path, ENOSPC);
        }
        total += static_cast<size_t>(n);
    }
}

void FileDestination::truncate(uint64_t size)
{
    if (m_kind != DestinationKind::RegularFile)
    {
        return;
    }
    if (::ftruncate(m_fd, static_cast<off_t>(size)) != 0)
    {
        const int err = errno;
        throw_io_error(fmt::format("cannot truncate '{}' to {} bytes: {}", m_path, size,
                                   errno_text(err)),
                       m_path, err);
    }
}

void FileDestination::flush()
{
    // Writes go straight to the descriptor; nothing is buffered in user space.
}

void FileDestination::sync()
{
    if (m_device_id && m_kind == DestinationKind::CharDevice && m_device_id->first == 1 &&
        m_device_id->second == 3)
    {
        // /dev/null
        return;
    }
    if (::fsync(m_fd) != 0)
    {
        const int err = errno;
        if (err == EINVAL && m_kind == DestinationKind::CharDevice)
        {
            return;
        }
        throw_io_error(fmt::format("cannot synchronize '{}': {}", m_path, errno_text(err)), m_path,
                       err);
    }
}

uint64_t FileDestination::capacity()
{
    const off_t end = ::lseek(m_fd, 0, SEEK_END);
    if (end == -1)
    {
        const int err = errno;
        throw_io_error(fmt::format("cannot seek to the end of '{}': {}", m_path, errno_text(err)),
                       m_path, err);
    }
    if (::lseek(m_fd, 0, SEEK_SET) == -1)
    {
        const int err = errno;
        throw_io_error(fmt::format("cannot seek to the beginning of '{}': {}", m_path,
                                   errno_text(err)),
                       m_path, err);
    }
    return static_cast<uint64_t>(end);
}

} // namespace bmapcopy::bmap
