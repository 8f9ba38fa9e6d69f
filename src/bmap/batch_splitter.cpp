#include "bmap/batch_splitter.hpp"

#include <stdexcept>

namespace bmapcopy::bmap
{

BatchSplitter::BatchSplitter(uint64_t first, uint64_t last, uint64_t batch_blocks)
    : m_next(first), m_last(last), m_batch(batch_blocks)
{
    if (batch_blocks == 0)
    {
        throw std::invalid_argument("BatchSplitter: batch size must be at least one block");
    }
    if (first > last)
    {
        throw std::invalid_argument("BatchSplitter: first block is after last block");
    }
}

std::optional<Batch> BatchSplitter::next() noexcept
{
    if (m_done)
    {
        return std::nullopt;
    }
    const uint64_t remaining = m_last - m_next + 1;
    const uint64_t length = remaining < m_batch ? remaining : m_batch;
    Batch batch{m_next, m_next + length - 1, length};
    if (batch.end == m_last)
    {
        m_done = true;
    }
    else
    {
        m_next = batch.end + 1;
    }
    return batch;
}

std::vector<Batch> split_range(uint64_t first, uint64_t last, uint64_t batch_blocks)
{
    BatchSplitter splitter(first, last, batch_blocks);
    std::vector<Batch> out;
    out.reserve(static_cast<size_t>((last - first) / batch_blocks + 1));
    while (auto batch = splitter.next())
    {
        out.push_back(*batch);
    }
    return out;
}

} // namespace bmapcopy::bmap
