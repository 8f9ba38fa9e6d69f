/**
 * @file test_copy_config.cpp
 * @brief Tests for the bmapcopy JSON configuration.
 */
#include "test_patterns.h"
#include "shared_test_helpers.h"
#include "copy_config.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using bmapcopy::cli::CopyConfig;
using namespace bmapcopy::tests::helper;
using ::testing::HasSubstr;
using json = nlohmann::json;

class CopyConfigTest : public bmapcopy::tests::PureApiTest
{
  protected:
    static void ExpectRejected(const json &j, const std::string &fragment)
    {
        try
        {
            (void)CopyConfig::from_json(j, "test.json");
            FAIL() << "accepted " << j.dump();
        }
        catch (const std::runtime_error &e)
        {
            EXPECT_THAT(e.what(), HasSubstr(fragment)) << j.dump();
            EXPECT_THAT(e.what(), HasSubstr("test.json"));
        }
    }
};

TEST_F(CopyConfigTest, EmptyObjectGivesDefaults)
{
    const CopyConfig cfg = CopyConfig::from_json(json::object(), "test.json");
    EXPECT_TRUE(cfg.verify);
    EXPECT_TRUE(cfg.sync);
    EXPECT_EQ(cfg.batch_bytes, bmapcopy::bmap::DEFAULT_BATCH_BYTES);
    EXPECT_FALSE(cfg.queue_length.has_value());
    EXPECT_FALSE(cfg.fsync_watermark_bytes.has_value());
    EXPECT_TRUE(cfg.tuning_enabled);
    EXPECT_EQ(cfg.scheduler, "noop");
    EXPECT_EQ(cfg.max_ratio, "1");
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_TRUE(cfg.log_file.empty());
    EXPECT_TRUE(cfg.progress);
}

TEST_F(CopyConfigTest, ReadsEverySection)
{
    const json j = {
        {"copy",
         {{"verify", false},
          {"sync", false},
          {"batch_bytes", 65536},
          {"queue_length", 4},
          {"fsync_watermark_bytes", 1048576}}},
        {"tuning",
         {{"enabled", false}, {"scheduler", "none"}, {"max_ratio", 20}, {"sysfs_root", "/tmp/sys"}}},
        {"logging", {{"level", "debug"}, {"file", "/tmp/bmapcopy.log"}}},
        {"progress", false}};
    const CopyConfig cfg = CopyConfig::from_json(j, "test.json");
    EXPECT_FALSE(cfg.verify);
    EXPECT_FALSE(cfg.sync);
    EXPECT_EQ(cfg.batch_bytes, 65536u);
    EXPECT_EQ(cfg.queue_length, 4u);
    EXPECT_EQ(cfg.fsync_watermark_bytes, 1048576u);
    EXPECT_FALSE(cfg.tuning_enabled);
    EXPECT_EQ(cfg.scheduler, "none");
    EXPECT_EQ(cfg.max_ratio, "20");
    EXPECT_EQ(cfg.sysfs_root, "/tmp/sys");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.log_file, "/tmp/bmapcopy.log");
    EXPECT_FALSE(cfg.progress);
}

TEST_F(CopyConfigTest, RejectsInvalidFields)
{
    ExpectRejected(json::array(), "must be a JSON object");
    ExpectRejected({{"copy", 1}}, "'copy'");
    ExpectRejected({{"copy", {{"verify", "yes"}}}}, "'verify'");
    ExpectRejected({{"copy", {{"batch_bytes", 0}}}}, "greater than zero");
    ExpectRejected({{"copy", {{"batch_bytes", -4096}}}}, "non-negative integer");
    ExpectRejected({{"copy", {{"queue_length", 0}}}}, "at least 1");
    ExpectRejected({{"tuning", {{"scheduler", ""}}}}, "must not be empty");
    ExpectRejected({{"tuning", {{"max_ratio", 101}}}}, "between 0 and 100");
    ExpectRejected({{"tuning", {{"max_ratio", "1"}}}}, "between 0 and 100");
    ExpectRejected({{"logging", {{"level", "verbose"}}}}, "unknown log level 'verbose'");
    ExpectRejected({{"progress", 1}}, "'progress'");
}

TEST_F(CopyConfigTest, MapsToCopyOptions)
{
    CopyConfig cfg;
    cfg.verify = false;
    cfg.batch_bytes = 8192;
    cfg.queue_length = 3;
    cfg.tuning_enabled = false;
    cfg.scheduler = "mq-deadline";
    cfg.max_ratio = "5";
    cfg.sysfs_root = "/tmp/sys";

    const auto opts = cfg.to_copy_options();
    EXPECT_FALSE(opts.verify);
    EXPECT_TRUE(opts.sync);
    EXPECT_EQ(opts.batch_bytes, 8192u);
    EXPECT_EQ(opts.queue_length, 3u);
    EXPECT_FALSE(opts.sync_watermark_bytes.has_value());
    EXPECT_FALSE(opts.tune_device);
    EXPECT_EQ(opts.tuner.scheduler, "mq-deadline");
    EXPECT_EQ(opts.tuner.max_ratio, "5");
    EXPECT_EQ(opts.tuner.sysfs_root, std::filesystem::path("/tmp/sys"));
    EXPECT_EQ(opts.progress, nullptr);
}

TEST_F(CopyConfigTest, LoadsFromFile)
{
    ScratchDir dir("copy_config");
    const auto path = (dir / "bmapcopy.json").string();
    ASSERT_TRUE(write_file_contents(path, R"({ "copy": { "verify": false }, "progress": false })"));
    const CopyConfig cfg = CopyConfig::from_json_file(path);
    EXPECT_FALSE(cfg.verify);
    EXPECT_FALSE(cfg.progress);
}

TEST_F(CopyConfigTest, FileErrors)
{
    ScratchDir dir("copy_config");
    try
    {
        (void)CopyConfig::from_json_file((dir / "missing.json").string());
        FAIL();
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("cannot open file"));
    }

    const auto path = (dir / "broken.json").string();
    ASSERT_TRUE(write_file_contents(path, "{ \"copy\": "));
    try
    {
        (void)CopyConfig::from_json_file(path);
        FAIL();
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("JSON parse error"));
    }
}
