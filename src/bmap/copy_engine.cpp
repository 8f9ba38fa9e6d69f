/**
 * @file copy_engine.cpp
 * @brief Orchestration of a copy run: tuning, pipeline, finalization.
 */
#include "bmc_service.hpp"
#include "bmap/copy_engine.hpp"
#include "bmap/pipeline.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace bmapcopy::bmap
{

const char *to_string(EngineState state) noexcept
{
    switch (state)
    {
    case EngineState::Created:
        return "Created";
    case EngineState::SizeUnknown:
        return "SizeUnknown";
    case EngineState::Copying:
        return "Copying";
    case EngineState::Completed:
        return "Completed";
    case EngineState::Failed:
        return "Failed";
    }
    return "Unknown";
}

CopyEngine::CopyEngine(std::unique_ptr<ImageSource> source,
                       std::unique_ptr<Destination> destination, std::optional<BmapDocument> bmap,
                       CopyOptions options, std::unique_ptr<DeviceTuner> tuner)
    : m_source(std::move(source)), m_destination(std::move(destination)),
      m_options(std::move(options)), m_tuner(std::move(tuner))
{
    if (!m_source || !m_destination)
    {
        throw std::invalid_argument("CopyEngine requires an image source and a destination");
    }
    if (!m_tuner)
    {
        m_tuner = std::make_unique<NoopDeviceTuner>();
    }

    if (bmap)
    {
        m_metadata = std::move(bmap->metadata);
        m_ranges = std::move(bmap->ranges);
        m_bmap_origin = std::move(bmap->origin);
    }
    else
    {
        m_metadata = BmapMetadata::without_bmap();
        if (!m_options.image_size)
        {
            if (auto size = m_source->size())
            {
                m_metadata.set_image_size(*size);
            }
        }
    }
    if (m_options.image_size)
    {
        m_metadata.set_image_size(*m_options.image_size);
    }

    const bool block_device = m_destination->kind() == DestinationKind::BlockDevice;
    if (!m_options.queue_length)
    {
        m_options.queue_length = block_device ? BLOCK_DEVICE_QUEUE_LENGTH : DEFAULT_QUEUE_LENGTH;
    }
    if (!m_options.sync_watermark_bytes)
    {
        m_options.sync_watermark_bytes = block_device ? BLOCK_DEVICE_SYNC_WATERMARK_BYTES : 0;
    }

    m_state = m_metadata.image_size() ? EngineState::Created : EngineState::SizeUnknown;
}

CopyEngine::~CopyEngine() = default;

std::unique_ptr<CopyEngine> CopyEngine::open(const std::filesystem::path &image,
                                             const std::filesystem::path &destination,
                                             std::optional<BmapDocument> bmap,
                                             CopyOptions options)
{
    auto source = std::make_unique<FileImageSource>(image);
    auto dest = std::make_unique<FileDestination>(destination);

    std::unique_ptr<DeviceTuner> tuner;
    if (dest->kind() == DestinationKind::BlockDevice && options.tune_device)
    {
        if (auto id = dest->device_id())
        {
            tuner = SysfsDeviceTuner::for_device(id->first, id->second, options.tuner);
        }
    }
    return std::make_unique<CopyEngine>(std::move(source), std::move(dest), std::move(bmap),
                                        std::move(options), std::move(tuner));
}

CopyStats CopyEngine::copy()
{
    if (m_state != EngineState::Created && m_state != EngineState::SizeUnknown)
    {
        throw std::logic_error(fmt::format("CopyEngine::copy() may only run once (state is {})",
                                           to_string(m_state)));
    }

    try
    {
        check_capacity();
    }
    catch (const BmapError &)
    {
        m_state = EngineState::Failed;
        throw;
    }

    LOGGER_INFO("[copy] '{}' -> '{}' ({}), block size {}, {} blocks mapped{}", m_source->path(),
                m_destination->path(), to_string(m_destination->kind()), m_metadata.block_size,
                m_metadata.mapped_count() ? fmt::format("{}", *m_metadata.mapped_count())
                                          : std::string("unknown"),
                m_bmap_origin.empty() ? std::string() : fmt::format(", bmap '{}'", m_bmap_origin));

    m_tuner->apply();
    m_state = EngineState::Copying;

    CopyStats stats;
    try
    {
        stats = run_pipeline();
    }
    catch (const std::exception &copy_error)
    {
        m_state = EngineState::Failed;
        try
        {
            m_tuner->restore();
        }
        catch (const RestoreError &restore_error)
        {
            LOGGER_ERROR("[copy] {} (while handling: {})", restore_error.what(), copy_error.what());
        }
        throw;
    }

    try
    {
        m_tuner->restore();
    }
    catch (const RestoreError &)
    {
        m_state = EngineState::Failed;
        throw;
    }

    m_state = EngineState::Completed;
    LOGGER_INFO("[copy] wrote {} blocks ({} bytes) to '{}'", stats.blocks_written,
                stats.bytes_written, m_destination->path());
    return stats;
}

void CopyEngine::check_capacity()
{
    const auto image_size = m_metadata.image_size();
    if (m_destination->kind() != DestinationKind::BlockDevice || !image_size)
    {
        return;
    }
    const uint64_t capacity = m_destination->capacity();
    if (capacity < *image_size)
    {
        ErrorInfo info;
        info.kind = ErrorKind::Capacity;
        info.message = fmt::format("the image has size {} bytes and it will not fit the block "
                                   "device '{}' which has {} bytes capacity",
                                   *image_size, m_destination->path(), capacity);
        info.path = m_destination->path();
        throw_error(std::move(info));
    }
}

CopyStats CopyEngine::run_pipeline()
{
    const uint64_t bs = m_metadata.block_size;
    const uint64_t batch_blocks = batch_blocks_for(m_options.batch_bytes, bs);

    const bool has_checksums = std::any_of(m_ranges.begin(), m_ranges.end(),
                                           [](const Range &r) { return r.checksum.has_value(); });
    const bool verify = m_options.verify && has_checksums && m_metadata.can_verify();
    if (verify)
    {
        LOGGER_DEBUG("[copy] verifying {} range checksums from '{}'",
                     to_string(m_metadata.checksum_type), m_bmap_origin);
    }

    RangePlanner planner = m_metadata.has_document()
                               ? RangePlanner::from_ranges(m_ranges)
                               : (m_metadata.blocks_count()
                                      ? RangePlanner::whole_image(*m_metadata.blocks_count())
                                      : RangePlanner::open_ended(batch_blocks));

    PipelineChannel channel(*m_options.queue_length);
    ReaderOptions reader_opts{bs, batch_blocks, verify, m_metadata.checksum_type};
    BlockReader reader(*m_source, std::move(planner), reader_opts, channel);

    WriterOptions writer_opts{bs, *m_options.sync_watermark_bytes / bs};
    ProgressReporter progress(m_options.progress, m_metadata.mapped_count());
    BlockWriter writer(*m_destination, writer_opts, channel, &progress);

    std::thread reader_thread([&reader] { reader.run(); });
    // Closing the channel unblocks a reader stuck on a full channel after a writer failure.
    auto join_reader = bmapcopy::basics::make_scope_guard(
        [&]()
        {
            channel.close();
            if (reader_thread.joinable())
            {
                reader_thread.join();
            }
        });

    WriteStats written = writer.run();
    join_reader.invoke();
    progress.finish();

    CopyStats stats;
    stats.blocks_written = written.blocks_written;
    stats.bytes_written = written.bytes_written;
    finalize(stats, reader.bytes_read());
    return stats;
}

void CopyEngine::finalize(CopyStats &stats, uint64_t bytes_read)
{
    if (!m_metadata.image_size())
    {
        m_metadata.set_image_size(bytes_read);
        LOGGER_DEBUG("[copy] image size of '{}' is {} bytes", m_source->path(), bytes_read);
    }

    const uint64_t expected = m_metadata.mapped_count().value_or(0);
    if (stats.blocks_written != expected)
    {
        ErrorInfo info;
        info.kind = ErrorKind::InconsistentBmap;
        info.message = fmt::format("wrote {} blocks from image '{}' to '{}', but should have {} - "
                                   "bmap file '{}' does not belong to this image",
                                   stats.blocks_written, m_source->path(), m_destination->path(),
                                   expected, m_bmap_origin);
        info.path = m_destination->path();
        throw_error(std::move(info));
    }

    stats.image_size = *m_metadata.image_size();
    if (m_destination->kind() == DestinationKind::RegularFile)
    {
        m_destination->truncate(stats.image_size);
    }
    m_destination->flush();
    if (m_options.sync)
    {
        sync();
    }
}

void CopyEngine::sync()
{
    m_destination->sync();
}

} // namespace bmapcopy::bmap
