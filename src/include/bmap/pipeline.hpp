#pragma once
/**
 * @file pipeline.hpp
 * @brief The reader (producer) and writer (consumer) halves of a copy run.
 *
 * The reader walks RangePlanner x BatchSplitter, reads each batch from the image,
 * verifies range checksums and pushes messages. The writer pops them in order and
 * writes the data. A run ends with exactly one EndOfStream, or with one Error that
 * the writer turns back into an exception.
 */
#include "bmapcopy_core_export.h"
#include "bmap/bounded_channel.hpp"
#include "bmap/errors.hpp"
#include "bmap/image_io.hpp"
#include "bmap/progress.hpp"
#include "bmap/range_planner.hpp"

#include <atomic>
#include <cstdint>
#include <variant>
#include <vector>

namespace bmapcopy::bmap
{

struct DataMessage
{
    uint64_t start = 0;
    uint64_t end = 0;
    std::vector<uint8_t> bytes;
};

struct EndOfStream
{
};

struct ErrorMessage
{
    ErrorInfo info;
};

using PipelineMessage = std::variant<DataMessage, EndOfStream, ErrorMessage>;
using PipelineChannel = BoundedChannel<PipelineMessage>;

struct ReaderOptions
{
    uint64_t block_size = DEFAULT_BLOCK_SIZE;
    uint64_t batch_blocks = 1;
    /** Verify per-range checksums. */
    bool verify = true;
    ChecksumType checksum_type = ChecksumType::Sha256;
};

/**
 * @class BlockReader
 * @brief Producer task. Never throws; every failure becomes an ErrorMessage.
 */
class BMAPCOPY_CORE_EXPORT BlockReader
{
  public:
    BlockReader(ImageSource &source, RangePlanner planner, ReaderOptions options,
                PipelineChannel &channel);

    /** @brief Runs to EndOfStream, an error, or a closed channel. */
    void run() noexcept;

    /** @brief Bytes read from the image so far. */
    [[nodiscard]] uint64_t bytes_read() const noexcept
    {
        return m_bytes_read.load(std::memory_order_acquire);
    }

  private:
    /** @return false if the run is over (error pushed, end of data, or channel closed). */
    bool copy_range(const Range &range, bool &end_of_data);

    ImageSource &m_source;
    RangePlanner m_planner;
    ReaderOptions m_options;
    PipelineChannel &m_channel;
    std::atomic<uint64_t> m_bytes_read{0};
};

struct WriterOptions
{
    uint64_t block_size = DEFAULT_BLOCK_SIZE;
    /** Sync once this many blocks were written since the last sync; 0 disables. */
    uint64_t sync_watermark_blocks = 0;
};

struct WriteStats
{
    uint64_t blocks_written = 0;
    uint64_t bytes_written = 0;
    uint64_t syncs = 0;
};

/**
 * @class BlockWriter
 * @brief Consumer task, run on the calling thread.
 */
class BMAPCOPY_CORE_EXPORT BlockWriter
{
  public:
    BlockWriter(Destination &destination, WriterOptions options, PipelineChannel &channel,
                ProgressReporter *progress = nullptr);

    /**
     * @brief Writes every DataMessage until EndOfStream.
     * @throws the error carried by an ErrorMessage, or IOError from the destination.
     */
    WriteStats run();

  private:
    Destination &m_destination;
    WriterOptions m_options;
    PipelineChannel &m_channel;
    ProgressReporter *m_progress;
};

} // namespace bmapcopy::bmap
