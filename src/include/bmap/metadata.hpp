#pragma once
/**
 * @file metadata.hpp
 * @brief BmapMetadata and Range: the parsed content of a block map.
 */
#include "bmapcopy_core_export.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bmapcopy::bmap
{

/** Highest block-map major version this engine understands. */
inline constexpr unsigned SUPPORTED_MAJOR_VERSION = 2;

/** Block size used when there is no block map. */
inline constexpr uint64_t DEFAULT_BLOCK_SIZE = 4096;

enum class ChecksumType
{
    None,
    Sha1,
    Sha256
};

BMAPCOPY_CORE_EXPORT const char *to_string(ChecksumType type) noexcept;

/**
 * @brief An inclusive run of mapped blocks, with its optional hex checksum.
 */
struct Range
{
    uint64_t first = 0;
    uint64_t last = 0;
    std::optional<std::string> checksum;

    [[nodiscard]] uint64_t length() const noexcept { return last - first + 1; }
};

/**
 * @class BmapMetadata
 * @brief Geometry and checksum settings of an image.
 *
 * `image_size` is set at most once. It may stay unknown until a streaming copy has
 * seen the last byte; once known, `blocks_count` follows from it. A second, different
 * value throws InconsistentMetadataError.
 */
class BMAPCOPY_CORE_EXPORT BmapMetadata
{
  public:
    BmapMetadata() = default;

    /**
     * @brief The "everything mapped" geometry used when there is no block map.
     * @param image_size Image size if known upfront.
     */
    static BmapMetadata without_bmap(std::optional<uint64_t> image_size = std::nullopt);

    unsigned version_major = 0;
    unsigned version_minor = 0;
    uint64_t block_size = DEFAULT_BLOCK_SIZE;
    ChecksumType checksum_type = ChecksumType::None;
    std::optional<std::string> document_checksum;
    bool from_document = false;

    /**
     * @brief Records the image size, filling blocks_count (and mapped_count when no
     *        document supplied one).
     * @throws InconsistentMetadataError if a different size is already known.
     */
    void set_image_size(uint64_t size);

    /** @brief Sets the declared block counts from a document. */
    void set_block_counts(uint64_t blocks, uint64_t mapped);

    [[nodiscard]] std::optional<uint64_t> image_size() const noexcept { return m_image_size; }
    [[nodiscard]] std::optional<uint64_t> blocks_count() const noexcept { return m_blocks_count; }
    [[nodiscard]] std::optional<uint64_t> mapped_count() const noexcept { return m_mapped_count; }

    /** @brief mapped_count * block_size, when mapped_count is known. */
    [[nodiscard]] std::optional<uint64_t> mapped_size() const noexcept;
    /** @brief Share of mapped blocks in percent; 100 for an empty image. */
    [[nodiscard]] std::optional<double> mapped_percent() const noexcept;

    /** @brief True when the metadata came from a block-map document. */
    [[nodiscard]] bool has_document() const noexcept { return from_document; }

    /** @brief Whether per-range checksums can be verified with the available crypto. */
    [[nodiscard]] bool can_verify() const noexcept
    {
        return checksum_type == ChecksumType::Sha256 || checksum_type == ChecksumType::Sha1;
    }

  private:
    std::optional<uint64_t> m_image_size;
    std::optional<uint64_t> m_blocks_count;
    std::optional<uint64_t> m_mapped_count;
};

/** @brief Number of blocks needed to hold `bytes`. */
[[nodiscard]] constexpr uint64_t blocks_for_bytes(uint64_t bytes, uint64_t block_size) noexcept
{
    return (bytes + block_size - 1) / block_size;
}

/**
 * @brief Metadata plus the ordered range list of a block map.
 */
struct BmapDocument
{
    BmapMetadata metadata;
    std::vector<Range> ranges;
    /** Where the document was read from, for messages. */
    std::string origin;
};

} // namespace bmapcopy::bmap
