#pragma once
/**
 * @file batch_splitter.hpp
 * @brief Splits a block range into bounded I/O batches.
 */
#include "bmapcopy_core_export.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace bmapcopy::bmap
{

/** Upper bound of bytes moved by one read or write call. */
inline constexpr uint64_t DEFAULT_BATCH_BYTES = 1024 * 1024;

struct Batch
{
    uint64_t start = 0;
    uint64_t end = 0;
    uint64_t length = 0;

    bool operator==(const Batch &) const = default;
};

/**
 * @class BatchSplitter
 * @brief Lazily partitions `[first, last]` into chunks of `batch_blocks` blocks.
 *
 * All chunks but the last have exactly `batch_blocks` blocks.
 */
class BMAPCOPY_CORE_EXPORT BatchSplitter
{
  public:
    /** @throws std::invalid_argument if `batch_blocks == 0` or `first > last`. */
    BatchSplitter(uint64_t first, uint64_t last, uint64_t batch_blocks);

    std::optional<Batch> next() noexcept;

  private:
    uint64_t m_next;
    uint64_t m_last;
    uint64_t m_batch;
    bool m_done = false;
};

/** @brief Eager form of BatchSplitter. */
BMAPCOPY_CORE_EXPORT std::vector<Batch> split_range(uint64_t first, uint64_t last,
                                                    uint64_t batch_blocks);

/** @brief Blocks per batch for a byte budget; at least 1. */
[[nodiscard]] constexpr uint64_t batch_blocks_for(uint64_t batch_bytes,
                                                  uint64_t block_size) noexcept
{
    const uint64_t blocks = block_size == 0 ? 0 : batch_bytes / block_size;
    return blocks == 0 ? 1 : blocks;
}

} // namespace bmapcopy::bmap
