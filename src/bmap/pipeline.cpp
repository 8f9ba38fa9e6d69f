/**
 * @file pipeline.cpp
 * @brief BlockReader and BlockWriter.
 */
#include "bmc_service.hpp"
#include "bmap/batch_splitter.hpp"
#include "bmap/pipeline.hpp"

#include <optional>
#include <variant>

namespace bmapcopy::bmap
{

// ============================================================================
// BlockReader
// ============================================================================

namespace
{
using RangeHash = std::variant<bmapcopy::crypto::Sha256Stream, bmapcopy::crypto::Sha1Stream>;

std::optional<RangeHash> make_range_hash(ChecksumType type)
{
    switch (type)
    {
    case ChecksumType::Sha256:
        return RangeHash(std::in_place_type<bmapcopy::crypto::Sha256Stream>);
    case ChecksumType::Sha1:
        return RangeHash(std::in_place_type<bmapcopy::crypto::Sha1Stream>);
    case ChecksumType::None:
        break;
    }
    return std::nullopt;
}
} // namespace

BlockReader::BlockReader(ImageSource &source, RangePlanner planner, ReaderOptions options,
                         PipelineChannel &channel)
    : m_source(source), m_planner(std::move(planner)), m_options(options), m_channel(channel)
{
}

bool BlockReader::copy_range(const Range &range, bool &end_of_data)
{
    const uint64_t bs = m_options.block_size;
    const bool open_ended = m_planner.is_open_ended();

    std::optional<RangeHash> hash;
    if (m_options.verify && range.checksum)
    {
        hash = make_range_hash(m_options.checksum_type);
    }

    BatchSplitter splitter(range.first, range.last, m_options.batch_blocks);
    while (auto batch = splitter.next())
    {
        std::vector<uint8_t> bytes(static_cast<size_t>(batch->length * bs));
        const size_t n = m_source.read_at(batch->start * bs, bytes.data(), bytes.size());
        m_bytes_read.fetch_add(n, std::memory_order_acq_rel);

        if (n == 0)
        {
            if (open_ended)
            {
                end_of_data = true;
                return true;
            }
            ErrorInfo info;
            info.kind = ErrorKind::IO;
            info.message = fmt::format("the image file '{}' is too short: no data at block {}",
                                       m_source.path(), batch->start);
            info.path = m_source.path();
            info.first_block = batch->start;
            info.last_block = batch->end;
            m_channel.push(ErrorMessage{std::move(info)});
            return false;
        }

        const bool short_read = n < bytes.size();
        bytes.resize(n);
        if (hash)
        {
            std::visit([&bytes](auto &h) { h.update(bytes.data(), bytes.size()); }, *hash);
        }
        const uint64_t end = batch->start + blocks_for_bytes(n, bs) - 1;
        if (!m_channel.push(DataMessage{batch->start, end, std::move(bytes)}))
        {
            return false;
        }
        if (short_read && open_ended)
        {
            end_of_data = true;
            break;
        }
    }

    if (hash)
    {
        const std::string calculated = std::visit([](auto &h) { return h.final_hex(); }, *hash);
        if (!bmapcopy::crypto::hex_digest_equals(calculated, *range.checksum))
        {
            ErrorInfo info;
            info.kind = ErrorKind::ChecksumMismatch;
            info.message = fmt::format("checksum mismatch for blocks range {}-{}: calculated {}, "
                                       "should be {} (image file {})",
                                       range.first, range.last, calculated, *range.checksum,
                                       m_source.path());
            info.path = m_source.path();
            info.first_block = range.first;
            info.last_block = range.last;
            m_channel.push(ErrorMessage{std::move(info)});
            return false;
        }
    }
    return true;
}

void BlockReader::run() noexcept
{
    try
    {
        bool end_of_data = false;
        while (auto range = m_planner.next())
        {
            if (!copy_range(*range, end_of_data))
            {
                return;
            }
            if (end_of_data)
            {
                break;
            }
        }
        m_channel.push(EndOfStream{});
    }
    catch (const BmapError &e)
    {
        m_channel.push(ErrorMessage{e.info()});
    }
    catch (const std::exception &e)
    {
        ErrorInfo info;
        info.kind = ErrorKind::IO;
        info.message = fmt::format("error while reading image '{}': {}", m_source.path(), e.what());
        info.path = m_source.path();
        m_channel.push(ErrorMessage{std::move(info)});
    }
}

// ============================================================================
// BlockWriter
// ============================================================================

BlockWriter::BlockWriter(Destination &destination, WriterOptions options,
                         PipelineChannel &channel, ProgressReporter *progress)
    : m_destination(destination), m_options(options), m_channel(channel), m_progress(progress)
{
}

WriteStats BlockWriter::run()
{
    WriteStats stats;
    uint64_t last_sync = 0;

    for (;;)
    {
        std::optional<PipelineMessage> msg = m_channel.pop();
        if (!msg)
        {
            throw_io_error(fmt::format("the image reader stopped before the end of the data for "
                                       "'{}'",
                                       m_destination.path()),
                           m_destination.path(), 0);
        }

        if (auto *data = std::get_if<DataMessage>(&*msg))
        {
            m_destination.write_at(data->start * m_options.block_size, data->bytes.data(),
                                   data->bytes.size());
            stats.blocks_written += data->end - data->start + 1;
            stats.bytes_written += data->bytes.size();

            if (m_options.sync_watermark_blocks != 0 &&
                stats.blocks_written - last_sync > m_options.sync_watermark_blocks)
            {
                m_destination.sync();
                last_sync = stats.blocks_written;
                ++stats.syncs;
            }
            if (m_progress != nullptr)
            {
                m_progress->update(stats.blocks_written);
            }
        }
        else if (auto *error = std::get_if<ErrorMessage>(&*msg))
        {
            LOGGER_DEBUG("[copy] reader reported {}: {}", to_string(error->info.kind),
                         error->info.message);
            throw_error(std::move(error->info));
        }
        else
        {
            break;
        }
    }
    return stats;
}

} // namespace bmapcopy::bmap
