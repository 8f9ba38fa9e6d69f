#pragma once
/**
 * @file range_planner.hpp
 * @brief The ordered sequence of block ranges a copy run transfers.
 */
#include "bmapcopy_core_export.h"
#include "bmap/metadata.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace bmapcopy::bmap
{

/**
 * @class RangePlanner
 * @brief Yields the ranges to copy, one at a time. Single-use.
 *
 * Three modes:
 * - from a document: its ranges verbatim, in file order;
 * - whole image: one range `[0, blocks-1]`, nothing for an empty image;
 * - open-ended: `[n*step, n*step+step-1]` forever. The reader decides when the
 *   data ends.
 */
class BMAPCOPY_CORE_EXPORT RangePlanner
{
  public:
    static RangePlanner from_ranges(std::vector<Range> ranges);
    static RangePlanner whole_image(uint64_t blocks_count);
    /** @throws std::invalid_argument if `step_blocks` is 0. */
    static RangePlanner open_ended(uint64_t step_blocks);

    /** @brief The next range, or nullopt when the plan is exhausted. */
    std::optional<Range> next();

    /** @brief True if next() never returns nullopt. */
    [[nodiscard]] bool is_open_ended() const noexcept { return m_open_ended; }

  private:
    RangePlanner() = default;

    std::vector<Range> m_ranges;
    size_t m_index = 0;
    bool m_open_ended = false;
    uint64_t m_step = 0;
    uint64_t m_next_first = 0;
};

} // namespace bmapcopy::bmap
