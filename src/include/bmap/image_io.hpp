#pragma once
/**
 * @file image_io.hpp
 * @brief Byte sources for images and byte sinks for destinations.
 *
 * The reader thread owns the ImageSource and the writer thread owns the Destination;
 * neither class is synchronized.
 */
#include "bmapcopy_core_export.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace bmapcopy::bmap
{

class BMAPCOPY_CORE_EXPORT ImageSource
{
  public:
    virtual ~ImageSource() = default;

    /**
     * @brief Reads up to `len` bytes at `offset`.
     * @return Bytes read; less than `len` only at the end of the data.
     * @throws IOError on failure.
     */
    virtual size_t read_at(uint64_t offset, void *buf, size_t len) = 0;

    /** @brief Total size in bytes, when it can be known without reading. */
    [[nodiscard]] virtual std::optional<uint64_t> size() const = 0;

    [[nodiscard]] virtual const std::string &path() const noexcept = 0;
};

/**
 * @class FileImageSource
 * @brief ImageSource over a file descriptor.
 *
 * Regular files are read with positioned reads. Pipes and other non-seekable inputs
 * are read sequentially; a forward jump discards the bytes in between and a backward
 * jump is an IOError. The path "-" means standard input.
 */
class BMAPCOPY_CORE_EXPORT FileImageSource : public ImageSource
{
  public:
    /** @throws IOError if the file cannot be opened. */
    explicit FileImageSource(const std::filesystem::path &path);
    ~FileImageSource() override;

    FileImageSource(const FileImageSource &) = delete;
    FileImageSource &operator=(const FileImageSource &) = delete;

    size_t read_at(uint64_t offset, void *buf, size_t len) override;
    [[nodiscard]] std::optional<uint64_t> size() const override { return m_size; }
    [[nodiscard]] const std::string &path() const noexcept override { return m_path; }

    [[nodiscard]] bool is_seekable() const noexcept { return m_seekable; }

  private:
    size_t read_fully(void *buf, size_t len);

    std::string m_path;
    int m_fd = -1;
    bool m_owns_fd = true;
    bool m_seekable = true;
    uint64_t m_stream_pos = 0;
    std::optional<uint64_t> m_size;
};

enum class DestinationKind
{
    RegularFile,
    BlockDevice,
    CharDevice
};

BMAPCOPY_CORE_EXPORT const char *to_string(DestinationKind kind) noexcept;

class BMAPCOPY_CORE_EXPORT Destination
{
  public:
    virtual ~Destination() = default;

    /** @throws IOError unless all `len` bytes were written. */
    virtual void write_at(uint64_t offset, const void *data, size_t len) = 0;
    /** @brief Sets the file length; only meaningful for regular files. */
    virtual void truncate(uint64_t size) = 0;
    virtual void flush() = 0;
    /** @brief Commits written data to stable storage, where the target supports it. */
    virtual void sync() = 0;
    /** @brief Size found by seeking to the end. */
    [[nodiscard]] virtual uint64_t capacity() = 0;

    [[nodiscard]] virtual DestinationKind kind() const noexcept = 0;
    [[nodiscard]] virtual const std::string &path() const noexcept = 0;
    /** @brief major:minor of a device destination. */
    [[nodiscard]] virtual std::optional<std::pair<unsigned, unsigned>> device_id() const = 0;
};

/**
 * @class FileDestination
 * @brief Destination over a regular file, block device or character device.
 *
 * Block devices are opened `O_WRONLY | O_EXCL` so that a mounted device is refused;
 * regular files are created or truncated. Syncing `/dev/null` (1:3) is skipped.
 */
class BMAPCOPY_CORE_EXPORT FileDestination : public Destination
{
  public:
    /** @throws IOError if the destination cannot be opened. */
    explicit FileDestination(const std::filesystem::path &path);
    ~FileDestination() override;

    FileDestination(const FileDestination &) = delete;
    FileDestination &operator=(const FileDestination &) = delete;

    void write_at(uint64_t offset, const void *data, size_t len) override;
    void truncate(uint64_t size) override;
    void flush() override;
    void sync() override;
    [[nodiscard]] uint64_t capacity() override;

    [[nodiscard]] DestinationKind kind() const noexcept override { return m_kind; }
    [[nodiscard]] const std::string &path() const noexcept override { return m_path; }
    [[nodiscard]] std::optional<std::pair<unsigned, unsigned>> device_id() const override
    {
        return m_device_id;
    }

  private:
    std::string m_path;
    int m_fd = -1;
    DestinationKind m_kind = DestinationKind::RegularFile;
    std::optional<std::pair<unsigned, unsigned>> m_device_id;
};

} // namespace bmapcopy::bmap
