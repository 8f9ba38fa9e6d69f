#include "bmap/metadata.hpp"
#include "bmap/errors.hpp"

#include <fmt/format.h>

namespace bmapcopy::bmap
{

const char *to_string(ChecksumType type) noexcept
{
    switch (type)
    {
    case ChecksumType::None:
        return "none";
    case ChecksumType::Sha1:
        return "sha1";
    case ChecksumType::Sha256:
        return "sha256";
    }
    return "unknown";
}

BmapMetadata BmapMetadata::without_bmap(std::optional<uint64_t> image_size)
{
    BmapMetadata md;
    md.block_size = DEFAULT_BLOCK_SIZE;
    if (image_size)
    {
        md.set_image_size(*image_size);
    }
    return md;
}

void BmapMetadata::set_image_size(uint64_t size)
{
    if (m_image_size)
    {
        if (*m_image_size == size)
        {
            return;
        }
        ErrorInfo info;
        info.kind = ErrorKind::InconsistentMetadata;
        info.message = fmt::format("cannot set image size to {} bytes, it is known to be {} bytes",
                                   size, *m_image_size);
        throw InconsistentMetadataError(std::move(info));
    }
    m_image_size = size;
    m_blocks_count = blocks_for_bytes(size, block_size);
    if (!m_mapped_count)
    {
        m_mapped_count = m_blocks_count;
    }
}

void BmapMetadata::set_block_counts(uint64_t blocks, uint64_t mapped)
{
    m_blocks_count = blocks;
    m_mapped_count = mapped;
}

std::optional<uint64_t> BmapMetadata::mapped_size() const noexcept
{
    if (!m_mapped_count)
    {
        return std::nullopt;
    }
    return *m_mapped_count * block_size;
}

std::optional<double> BmapMetadata::mapped_percent() const noexcept
{
    if (!m_mapped_count || !m_blocks_count)
    {
        return std::nullopt;
    }
    if (*m_blocks_count == 0)
    {
        return 100.0;
    }
    return static_cast<double>(*m_mapped_count) * 100.0 / static_cast<double>(*m_blocks_count);
}

} // namespace bmapcopy::bmap
