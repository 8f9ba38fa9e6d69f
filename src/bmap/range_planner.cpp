#include "bmap/range_planner.hpp"

#include <stdexcept>

namespace bmapcopy::bmap
{

RangePlanner RangePlanner::from_ranges(std::vector<Range> ranges)
{
    RangePlanner planner;
    planner.m_ranges = std::move(ranges);
    return planner;
}

RangePlanner RangePlanner::whole_image(uint64_t blocks_count)
{
    RangePlanner planner;
    if (blocks_count > 0)
    {
        planner.m_ranges.push_back(Range{0, blocks_count - 1, std::nullopt});
    }
    return planner;
}

RangePlanner RangePlanner::open_ended(uint64_t step_blocks)
{
    if (step_blocks == 0)
    {
        throw std::invalid_argument("RangePlanner: step must be at least one block");
    }
    RangePlanner planner;
    planner.m_open_ended = true;
    planner.m_step = step_blocks;
    return planner;
}

std::optional<Range> RangePlanner::next()
{
    if (m_open_ended)
    {
        Range range{m_next_first, m_next_first + m_step - 1, std::nullopt};
        m_next_first += m_step;
        return range;
    }
    if (m_index >= m_ranges.size())
    {
        return std::nullopt;
    }
    return std::move(m_ranges[m_index++]);
}

} // namespace bmapcopy::bmap
