#pragma once
/**
 * @file copy_engine.hpp
 * @brief CopyEngine: one bmap-driven copy of an image to a file or block device.
 *
 * ## Usage
 * @code
 *   auto bmap = parse_bmap_file("image.bmap");
 *   auto engine = CopyEngine::open("image.raw", "/dev/sdb", std::move(bmap), {});
 *   CopyStats stats = engine->copy();
 * @endcode
 *
 * ## States
 *   Created -> (SizeUnknown) -> Copying -> Completed | Failed
 *
 * A tuner, when present, is restored on every exit from Copying. If the copy failed,
 * a restore failure is logged and the copy error propagates; after a successful copy
 * the RestoreError itself is thrown.
 */
#include "bmapcopy_core_export.h"
#include "bmap/batch_splitter.hpp"
#include "bmap/device_tuner.hpp"
#include "bmap/image_io.hpp"
#include "bmap/metadata.hpp"
#include "bmap/progress.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bmapcopy::bmap
{

/** Channel depth and sync watermark used for block devices. */
inline constexpr size_t BLOCK_DEVICE_QUEUE_LENGTH = 6;
inline constexpr uint64_t BLOCK_DEVICE_SYNC_WATERMARK_BYTES = 6 * 1024 * 1024;
inline constexpr size_t DEFAULT_QUEUE_LENGTH = 2;

struct CopyOptions
{
    /** Verify per-range checksums while reading. */
    bool verify = true;
    /** Sync the destination once the copy completed. */
    bool sync = true;
    uint64_t batch_bytes = DEFAULT_BATCH_BYTES;
    /** Unset: DEFAULT_QUEUE_LENGTH, or BLOCK_DEVICE_QUEUE_LENGTH for block devices. */
    std::optional<size_t> queue_length;
    /** Unset: 0 (off), or BLOCK_DEVICE_SYNC_WATERMARK_BYTES for block devices. */
    std::optional<uint64_t> sync_watermark_bytes;
    /** Known size of the image data, e.g. the size after decompression. */
    std::optional<uint64_t> image_size;
    /** Attach a SysfsDeviceTuner to block-device destinations (open() only). */
    bool tune_device = true;
    TunerOptions tuner;
    /** Not owned; may be null. */
    ProgressObserver *progress = nullptr;
};

struct CopyStats
{
    uint64_t blocks_written = 0;
    uint64_t bytes_written = 0;
    uint64_t image_size = 0;
};

enum class EngineState
{
    Created,
    SizeUnknown,
    Copying,
    Completed,
    Failed
};

BMAPCOPY_CORE_EXPORT const char *to_string(EngineState state) noexcept;

class BMAPCOPY_CORE_EXPORT CopyEngine
{
  public:
    /**
     * @param bmap  Parsed block map; without one every block of the image is copied.
     * @param tuner May be null (no tuning).
     * @throws InconsistentMetadataError if `options.image_size` conflicts with the map.
     */
    CopyEngine(std::unique_ptr<ImageSource> source, std::unique_ptr<Destination> destination,
               std::optional<BmapDocument> bmap, CopyOptions options,
               std::unique_ptr<DeviceTuner> tuner = nullptr);
    ~CopyEngine();

    CopyEngine(const CopyEngine &) = delete;
    CopyEngine &operator=(const CopyEngine &) = delete;

    /**
     * @brief Opens image and destination, applying block-device defaults and tuning.
     * @throws IOError if either cannot be opened.
     */
    static std::unique_ptr<CopyEngine> open(const std::filesystem::path &image,
                                            const std::filesystem::path &destination,
                                            std::optional<BmapDocument> bmap,
                                            CopyOptions options);

    /**
     * @brief Runs the copy. May be called once.
     *
     * A block-device destination smaller than a known image size fails with
     * CapacityError before the tuner is applied or anything is written.
     * @throws std::logic_error on a second call, BmapError subclasses on failure.
     */
    CopyStats copy();

    /** @brief Syncs the destination. Safe to call any number of times. */
    void sync();

    [[nodiscard]] EngineState state() const noexcept { return m_state; }
    [[nodiscard]] const BmapMetadata &metadata() const noexcept { return m_metadata; }
    [[nodiscard]] const DeviceTuner *tuner() const noexcept { return m_tuner.get(); }
    [[nodiscard]] const Destination &destination() const noexcept { return *m_destination; }

  private:
    void check_capacity();
    CopyStats run_pipeline();
    void finalize(CopyStats &stats, uint64_t bytes_read);

    std::unique_ptr<ImageSource> m_source;
    std::unique_ptr<Destination> m_destination;
    std::vector<Range> m_ranges;
    std::string m_bmap_origin;
    BmapMetadata m_metadata;
    CopyOptions m_options;
    std::unique_ptr<DeviceTuner> m_tuner;
    EngineState m_state = EngineState::Created;
};

} // namespace bmapcopy::bmap
