// tests/test_layer3_bmap/bmap_test_support.h
#pragma once
/**
 * @file bmap_test_support.h
 * @brief Builders and in-memory test doubles shared by the layer 3 tests.
 */
#include "bmc_core.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bmapcopy::tests::bmap_support
{

/** @brief Deterministic, non-zero image contents of `size` bytes. */
std::string make_image(uint64_t size, uint8_t seed = 1);

/**
 * @brief Describes a bmap document to generate.
 *
 * Range checksums are computed from the image passed to build_bmap_xml() unless
 * `range_checksums` is given. The document checksum is computed over the finished text
 * with the checksum replaced by zeros, the way the parser verifies it.
 */
struct BmapLayout
{
    std::string version = "2.0";
    uint64_t block_size = 4096;
    uint64_t image_size = 0;
    std::optional<uint64_t> blocks_count;  ///< default: derived from image_size
    std::optional<uint64_t> mapped_count;  ///< default: sum of range lengths
    std::string checksum_type = "sha256";
    std::vector<std::pair<uint64_t, uint64_t>> ranges;
    std::vector<std::string> range_checksums;
    bool with_range_checksums = true;
    bool with_document_checksum = true;
};

std::string build_bmap_xml(const BmapLayout &layout, std::string_view image);

/** @brief SHA-256 of the bytes of blocks [first, last], clipped to the image end. */
std::string range_sha256(std::string_view image, uint64_t block_size, uint64_t first,
                         uint64_t last);

/** @brief SHA-1 of the same bytes, as carried by version 1.x block maps. */
std::string range_sha1(std::string_view image, uint64_t block_size, uint64_t first,
                       uint64_t last);

/**
 * @brief ImageSource over an in-memory buffer; can hide its size to act like a stream.
 */
class MemoryImageSource : public bmap::ImageSource
{
  public:
    MemoryImageSource(std::string data, bool size_known, std::string path = "memory-image")
        : m_data(std::move(data)), m_size_known(size_known), m_path(std::move(path))
    {
    }

    size_t read_at(uint64_t offset, void *buf, size_t len) override;
    std::optional<uint64_t> size() const override
    {
        return m_size_known ? std::optional<uint64_t>(m_data.size()) : std::nullopt;
    }
    const std::string &path() const noexcept override { return m_path; }

  private:
    std::string m_data;
    bool m_size_known;
    std::string m_path;
};

/**
 * @brief Destination backed by a byte vector that records syncs and truncations.
 */
class MemoryDestination : public bmap::Destination
{
  public:
    explicit MemoryDestination(bmap::DestinationKind kind = bmap::DestinationKind::RegularFile,
                               uint64_t capacity = 0, std::string path = "memory-dest")
        : m_kind(kind), m_capacity(capacity), m_path(std::move(path))
    {
    }

    void write_at(uint64_t offset, const void *data, size_t len) override;
    void truncate(uint64_t size) override
    {
        m_data.resize(static_cast<size_t>(size), '\0');
        ++truncations;
    }
    void flush() override { ++flushes; }
    void sync() override { ++syncs; }
    uint64_t capacity() override { return m_capacity; }
    bmap::DestinationKind kind() const noexcept override { return m_kind; }
    const std::string &path() const noexcept override { return m_path; }
    std::optional<std::pair<unsigned, unsigned>> device_id() const override
    {
        return std::nullopt;
    }

    const std::string &data() const noexcept { return m_data; }

    int syncs = 0;
    int flushes = 0;
    int truncations = 0;
    uint64_t writes = 0;

  private:
    bmap::DestinationKind m_kind;
    uint64_t m_capacity;
    std::string m_path;
    std::string m_data;
};

/**
 * @brief DeviceTuner that records the calls it receives, for engine tests.
 */
class RecordingTuner : public bmap::DeviceTuner
{
  public:
    void apply() override { calls.emplace_back("apply"); }
    void restore() override { calls.emplace_back("restore"); }
    const std::vector<bmap::TuningWarning> &warnings() const noexcept override
    {
        return m_warnings;
    }

    std::vector<std::string> calls;

  private:
    std::vector<bmap::TuningWarning> m_warnings;
};

/** @brief Records observer callbacks. */
class RecordingObserver : public bmap::ProgressObserver
{
  public:
    void on_percent(int percent) override { percents.push_back(percent); }
    void on_tick() override { ++ticks; }
    void on_finished() override { ++finished; }

    std::vector<int> percents;
    int ticks = 0;
    int finished = 0;
};

} // namespace bmapcopy::tests::bmap_support
