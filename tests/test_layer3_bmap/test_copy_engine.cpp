/**
 * @file test_copy_engine.cpp
 * @brief Layer 3 end-to-end tests for CopyEngine.
 */
#include "test_patterns.h"
#include "shared_test_helpers.h"
#include "bmap_test_support.h"
#include "bmc_core.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace bmapcopy::bmap;
using namespace bmapcopy::tests::bmap_support;
using namespace bmapcopy::tests::helper;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class CopyEngineTest : public bmapcopy::tests::PureApiTest
{
  protected:
    static constexpr uint64_t kBs = 4096;

    void SetUp() override
    {
        image_ = make_image(16 * kBs);
        layout_.image_size = image_.size();
        layout_.ranges = {{0, 1}, {10, 11}};
        image_path_ = dir_ / "image.raw";
        dest_path_ = dir_ / "out.img";
        ASSERT_TRUE(write_file_contents(image_path_, image_));
    }

    BmapDocument bmap() { return parse_bmap(build_bmap_xml(layout_, image_), "image.bmap"); }

    std::string expected_sparse_copy() const
    {
        std::string out(image_.size(), '\0');
        for (const auto &[first, last] : layout_.ranges)
        {
            const size_t off = static_cast<size_t>(first * kBs);
            const size_t len = static_cast<size_t>((last - first + 1) * kBs);
            out.replace(off, len, image_, off, len);
        }
        return out;
    }

    std::string dest_contents() const
    {
        std::string s;
        read_file_contents(dest_path_.string(), s);
        return s;
    }

    ScratchDir dir_{"copy_engine"};
    std::string image_;
    BmapLayout layout_;
    fs::path image_path_;
    fs::path dest_path_;
};

TEST_F(CopyEngineTest, CopiesMappedBlocksToFile)
{
    RecordingObserver progress;
    CopyOptions opts;
    opts.progress = &progress;
    auto engine = CopyEngine::open(image_path_, dest_path_, bmap(), opts);
    EXPECT_EQ(engine->state(), EngineState::Created);
    EXPECT_EQ(engine->destination().kind(), DestinationKind::RegularFile);

    const auto stats = engine->copy();
    EXPECT_EQ(engine->state(), EngineState::Completed);
    EXPECT_EQ(stats.blocks_written, 4u);
    EXPECT_EQ(stats.bytes_written, 4u * kBs);
    EXPECT_EQ(stats.image_size, image_.size());
    EXPECT_EQ(dest_contents(), expected_sparse_copy());
    ASSERT_FALSE(progress.percents.empty());
    EXPECT_EQ(progress.percents.back(), 100);
    EXPECT_EQ(progress.finished, 1);
}

TEST_F(CopyEngineTest, CorruptionDetectedWhenVerifying)
{
    const BmapDocument doc = bmap();
    image_[10 * kBs + 123] ^= 0x01;
    ASSERT_TRUE(write_file_contents(image_path_, image_));

    auto engine = CopyEngine::open(image_path_, dest_path_, doc, CopyOptions{});
    try
    {
        engine->copy();
        FAIL() << "corruption must be detected";
    }
    catch (const ChecksumMismatchError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("10-11"));
    }
    EXPECT_EQ(engine->state(), EngineState::Failed);
}

TEST_F(CopyEngineTest, CorruptionCopiedWhenNotVerifying)
{
    const BmapDocument doc = bmap();
    image_[10 * kBs + 123] ^= 0x01;
    ASSERT_TRUE(write_file_contents(image_path_, image_));

    CopyOptions opts;
    opts.verify = false;
    auto engine = CopyEngine::open(image_path_, dest_path_, doc, opts);
    EXPECT_NO_THROW(engine->copy());
    EXPECT_EQ(dest_contents(), expected_sparse_copy());
}

TEST_F(CopyEngineTest, BmapOfAnotherImage)
{
    layout_.mapped_count = 5; // ranges cover 4 blocks
    auto engine = CopyEngine::open(image_path_, dest_path_, bmap(), CopyOptions{});
    try
    {
        engine->copy();
        FAIL();
    }
    catch (const InconsistentBmapError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("wrote 4 blocks"));
        EXPECT_THAT(e.what(), HasSubstr("but should have 5"));
        EXPECT_THAT(e.what(), HasSubstr("does not belong to this image"));
    }
}

TEST_F(CopyEngineTest, UnsupportedBmapFailsBeforeAnyIo)
{
    layout_.version = "3.0";
    EXPECT_THROW(
        CopyEngine::open(image_path_, dest_path_,
                         parse_bmap(build_bmap_xml(layout_, image_), "v3.bmap"), CopyOptions{}),
        UnsupportedVersionError);
    EXPECT_FALSE(fs::exists(dest_path_));
}

TEST_F(CopyEngineTest, WithoutBmapCopiesWholeImage)
{
    auto engine = CopyEngine::open(image_path_, dest_path_, std::nullopt, CopyOptions{});
    EXPECT_FALSE(engine->metadata().has_document());
    EXPECT_EQ(engine->metadata().mapped_count(), 16u);
    const auto stats = engine->copy();
    EXPECT_EQ(stats.blocks_written, 16u);
    EXPECT_EQ(dest_contents(), image_);
}

TEST_F(CopyEngineTest, UnknownSizeStream)
{
    const std::string data = make_image(7 * kBs + 1234, 9);
    auto dest = std::make_unique<MemoryDestination>();
    auto *dest_view = dest.get();
    CopyEngine engine(std::make_unique<MemoryImageSource>(data, false), std::move(dest),
                      std::nullopt, CopyOptions{});
    EXPECT_EQ(engine.state(), EngineState::SizeUnknown);
    EXPECT_FALSE(engine.metadata().image_size().has_value());

    const auto stats = engine.copy();
    EXPECT_EQ(stats.image_size, data.size());
    EXPECT_EQ(stats.blocks_written, 8u);
    EXPECT_EQ(engine.metadata().image_size(), data.size());
    EXPECT_EQ(engine.metadata().blocks_count(), 8u);
    EXPECT_EQ(dest_view->data(), data);
    EXPECT_EQ(dest_view->truncations, 1);
}

TEST_F(CopyEngineTest, ImageSizeOptionMustAgreeWithBmap)
{
    CopyOptions opts;
    opts.image_size = image_.size() + 1;
    EXPECT_THROW(CopyEngine::open(image_path_, dest_path_, bmap(), opts),
                 InconsistentMetadataError);
}

TEST_F(CopyEngineTest, ImageSizeOptionForStream)
{
    const std::string data = make_image(3 * kBs, 4);
    CopyOptions opts;
    opts.image_size = data.size();
    CopyEngine engine(std::make_unique<MemoryImageSource>(data, false),
                      std::make_unique<MemoryDestination>(), std::nullopt, opts);
    EXPECT_EQ(engine.state(), EngineState::Created);
    EXPECT_EQ(engine.copy().blocks_written, 3u);
}

TEST_F(CopyEngineTest, SyncCanBeRepeated)
{
    auto dest = std::make_unique<MemoryDestination>();
    auto *dest_view = dest.get();
    CopyEngine engine(std::make_unique<MemoryImageSource>(image_, true), std::move(dest), bmap(),
                      CopyOptions{});
    engine.copy();
    EXPECT_EQ(dest_view->syncs, 1);
    engine.sync();
    engine.sync();
    EXPECT_EQ(dest_view->syncs, 3);
}

TEST_F(CopyEngineTest, NoSyncOption)
{
    auto dest = std::make_unique<MemoryDestination>();
    auto *dest_view = dest.get();
    CopyOptions opts;
    opts.sync = false;
    CopyEngine engine(std::make_unique<MemoryImageSource>(image_, true), std::move(dest), bmap(),
                      opts);
    engine.copy();
    EXPECT_EQ(dest_view->syncs, 0);
    EXPECT_EQ(dest_view->flushes, 1);
}

TEST_F(CopyEngineTest, CopyRunsOnlyOnce)
{
    auto engine = CopyEngine::open(image_path_, dest_path_, bmap(), CopyOptions{});
    engine->copy();
    EXPECT_THROW(engine->copy(), std::logic_error);
}

TEST_F(CopyEngineTest, TunerIsAppliedAndRestored)
{
    auto tuner = std::make_unique<RecordingTuner>();
    auto *tuner_view = tuner.get();
    CopyEngine engine(std::make_unique<MemoryImageSource>(image_, true),
                      std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, 1 << 20),
                      bmap(), CopyOptions{}, std::move(tuner));
    engine.copy();
    EXPECT_THAT(tuner_view->calls, ElementsAre("apply", "restore"));
}

TEST_F(CopyEngineTest, TunerIsRestoredAfterFailure)
{
    image_[0] ^= 0x01;
    auto tuner = std::make_unique<RecordingTuner>();
    auto *tuner_view = tuner.get();
    layout_.ranges = {{0, 1}};
    const BmapDocument doc = parse_bmap(build_bmap_xml(layout_, make_image(16 * kBs)), "x.bmap");
    CopyEngine engine(std::make_unique<MemoryImageSource>(image_, true),
                      std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, 1 << 20),
                      doc, CopyOptions{}, std::move(tuner));
    EXPECT_THROW(engine.copy(), ChecksumMismatchError);
    EXPECT_THAT(tuner_view->calls, ElementsAre("apply", "restore"));
    EXPECT_EQ(engine.state(), EngineState::Failed);
}

TEST_F(CopyEngineTest, SmallBlockDeviceFailsBeforeTuning)
{
    auto tuner = std::make_unique<RecordingTuner>();
    auto *tuner_view = tuner.get();
    auto dest = std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, 4096);
    auto *dest_view = dest.get();
    CopyEngine engine(std::make_unique<MemoryImageSource>(image_, true), std::move(dest), bmap(),
                      CopyOptions{}, std::move(tuner));
    EXPECT_THROW(engine.copy(), CapacityError);
    EXPECT_TRUE(tuner_view->calls.empty());
    EXPECT_EQ(dest_view->writes, 0u);
    EXPECT_EQ(engine.state(), EngineState::Failed);
}

TEST_F(CopyEngineTest, SmallBlockDeviceFailsWithoutTuner)
{
    const std::string image = make_image(64 * 1024);
    auto dest = std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, 4096, "/dev/tiny");
    auto *dest_view = dest.get();
    CopyEngine engine(std::make_unique<MemoryImageSource>(image, true), std::move(dest),
                      std::nullopt, CopyOptions{});
    try
    {
        engine.copy();
        FAIL() << "a 64 KiB image does not fit a 4 KiB device";
    }
    catch (const CapacityError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Capacity);
        EXPECT_THAT(e.what(), HasSubstr("will not fit the block device '/dev/tiny'"));
        EXPECT_THAT(e.what(), HasSubstr("4096 bytes capacity"));
    }
    EXPECT_EQ(dest_view->writes, 0u);
    EXPECT_EQ(dest_view->syncs, 0);
    EXPECT_EQ(engine.state(), EngineState::Failed);
}

TEST_F(CopyEngineTest, ExactFitAndUnknownSizeSkipCapacityCheck)
{
    auto exact = std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, image_.size());
    CopyEngine fits(std::make_unique<MemoryImageSource>(image_, true), std::move(exact), bmap(),
                    CopyOptions{});
    EXPECT_NO_THROW(fits.copy());

    // A stream of unknown size cannot be checked upfront.
    auto small = std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, 4096);
    CopyEngine stream(std::make_unique<MemoryImageSource>(image_, false), std::move(small),
                      std::nullopt, CopyOptions{});
    EXPECT_NO_THROW(stream.copy());
    EXPECT_EQ(stream.state(), EngineState::Completed);

    // Regular files grow as needed.
    auto file = std::make_unique<MemoryDestination>(DestinationKind::RegularFile, 0);
    CopyEngine to_file(std::make_unique<MemoryImageSource>(image_, true), std::move(file), bmap(),
                       CopyOptions{});
    EXPECT_NO_THROW(to_file.copy());
}

TEST_F(CopyEngineTest, BlockDeviceIsNotTruncated)
{
    auto dest = std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, 1 << 20);
    auto *dest_view = dest.get();
    CopyEngine engine(std::make_unique<MemoryImageSource>(image_, true), std::move(dest), bmap(),
                      CopyOptions{});
    engine.copy();
    EXPECT_EQ(dest_view->truncations, 0);
    EXPECT_EQ(dest_view->data().size(), 12u * kBs) << "written up to the last mapped block";
}

TEST_F(CopyEngineTest, Version1BmapIsVerified)
{
    layout_.version = "1.2";
    layout_.with_document_checksum = false;
    const BmapDocument doc = bmap();
    ASSERT_EQ(doc.metadata.checksum_type, ChecksumType::Sha1);

    auto good = CopyEngine::open(image_path_, dest_path_, doc, CopyOptions{});
    EXPECT_NO_THROW(good->copy());
    EXPECT_EQ(dest_contents(), expected_sparse_copy());

    image_[10 * kBs + 7] ^= 0x01;
    ASSERT_TRUE(write_file_contents(image_path_, image_));
    auto bad = CopyEngine::open(image_path_, dest_path_, doc, CopyOptions{});
    try
    {
        bad->copy();
        FAIL() << "a corrupted range must fail its sha1 check";
    }
    catch (const ChecksumMismatchError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("10-11"));
        EXPECT_THAT(e.what(), HasSubstr(range_sha1(image_, kBs, 10, 11)));
    }
    EXPECT_EQ(bad->state(), EngineState::Failed);
}

TEST_F(CopyEngineTest, BogusSha1RangeChecksumIsRejected)
{
    layout_.version = "1.2";
    layout_.with_document_checksum = false;
    layout_.range_checksums = {range_sha1(image_, kBs, 0, 1), std::string(40, '0')};
    auto engine = CopyEngine::open(image_path_, dest_path_, bmap(), CopyOptions{});
    EXPECT_THROW(engine->copy(), ChecksumMismatchError);
    EXPECT_EQ(engine->state(), EngineState::Failed);
}

TEST_F(CopyEngineTest, Sha1ChecksumTypeInVersion2Bmap)
{
    layout_.checksum_type = "sha1";
    const BmapDocument doc = bmap();
    ASSERT_EQ(doc.metadata.checksum_type, ChecksumType::Sha1);
    image_[kBs] ^= 0x01;
    CopyEngine engine(std::make_unique<MemoryImageSource>(image_, true),
                      std::make_unique<MemoryDestination>(), doc, CopyOptions{});
    try
    {
        engine.copy();
        FAIL();
    }
    catch (const ChecksumMismatchError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("0-1"));
    }
}

// ============================================================================
// SysfsDeviceTuner driven by the engine
// ============================================================================

class CopyEngineSysfsTest : public CopyEngineTest
{
  protected:
    void SetUp() override
    {
        CopyEngineTest::SetUp();
        disk_ = dir_ / "sys" / "dev" / "block" / "8:0";
        fs::create_directories(disk_ / "queue");
        fs::create_directories(disk_ / "bdi");
        ASSERT_TRUE(write_file_contents(disk_ / "queue" / "scheduler", "noop deadline [cfq]\n"));
        ASSERT_TRUE(write_file_contents(disk_ / "bdi" / "max_ratio", "40\n"));
        tuner_opts_.sysfs_root = dir_ / "sys";
    }

    std::string pseudo_file(const fs::path &p) const
    {
        std::string s;
        read_file_contents(p.string(), s);
        return s;
    }

    std::unique_ptr<CopyEngine> make_engine(std::string image, BmapDocument doc)
    {
        return std::make_unique<CopyEngine>(
            std::make_unique<MemoryImageSource>(std::move(image), true),
            std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, 1 << 20, "/dev/sda"),
            std::move(doc), CopyOptions{}, SysfsDeviceTuner::for_device(8, 0, tuner_opts_));
    }

    fs::path disk_;
    TunerOptions tuner_opts_;
};

TEST_F(CopyEngineSysfsTest, SchedulerRestoredAfterCopy)
{
    auto engine = make_engine(image_, bmap());
    engine->copy();
    EXPECT_EQ(engine->state(), EngineState::Completed);
    EXPECT_EQ(pseudo_file(disk_ / "queue" / "scheduler"), "cfq");
    EXPECT_EQ(pseudo_file(disk_ / "bdi" / "max_ratio"), "40");
    ASSERT_NE(engine->tuner(), nullptr);
    EXPECT_TRUE(engine->tuner()->warnings().empty());
}

TEST_F(CopyEngineSysfsTest, SchedulerRestoredAfterChecksumFailure)
{
    const BmapDocument doc = bmap();
    std::string corrupted = image_;
    corrupted[10 * kBs] ^= 0x01;
    auto engine = make_engine(std::move(corrupted), doc);
    EXPECT_THROW(engine->copy(), ChecksumMismatchError);
    EXPECT_EQ(engine->state(), EngineState::Failed);
    EXPECT_EQ(pseudo_file(disk_ / "queue" / "scheduler"), "cfq");
    EXPECT_EQ(pseudo_file(disk_ / "bdi" / "max_ratio"), "40");
}

TEST_F(CopyEngineSysfsTest, TooSmallDeviceIsNeverTuned)
{
    auto engine = std::make_unique<CopyEngine>(
        std::make_unique<MemoryImageSource>(image_, true),
        std::make_unique<MemoryDestination>(DestinationKind::BlockDevice, 4096, "/dev/sda"),
        bmap(), CopyOptions{}, SysfsDeviceTuner::for_device(8, 0, tuner_opts_));
    EXPECT_THROW(engine->copy(), CapacityError);
    EXPECT_EQ(pseudo_file(disk_ / "queue" / "scheduler"), "noop deadline [cfq]\n");
}
