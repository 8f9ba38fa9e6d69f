/**
 * @file test_progress.cpp
 * @brief Layer 3 tests for ProgressReporter throttling and ConsoleProgress output.
 */
#include "test_patterns.h"
#include "bmap_test_support.h"
#include "bmc_core.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <cstdio>
#include <string>
#include <vector>

using namespace bmapcopy::bmap;
using bmapcopy::tests::bmap_support::RecordingObserver;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ProgressTest : public bmapcopy::tests::PureApiTest
{
};

TEST_F(ProgressTest, PercentEmittedOncePerValue)
{
    RecordingObserver obs;
    ProgressReporter p(&obs, 4);
    p.update(1);
    p.update(1);
    p.update(2);
    p.update(4);
    p.finish();
    EXPECT_THAT(obs.percents, ElementsAre(25, 50, 100));
    EXPECT_EQ(obs.ticks, 0);
    EXPECT_EQ(obs.finished, 1);
}

TEST_F(ProgressTest, FinishReportsCompletion)
{
    RecordingObserver obs;
    ProgressReporter p(&obs, 1000);
    p.update(10);
    p.finish();
    EXPECT_THAT(obs.percents, ElementsAre(1, 100));
}

TEST_F(ProgressTest, ZeroBlocksIsComplete)
{
    RecordingObserver obs;
    ProgressReporter p(&obs, 0);
    p.finish();
    EXPECT_THAT(obs.percents, ElementsAre(100));
}

TEST_F(ProgressTest, UnknownTotalTicksAtMostEveryInterval)
{
    RecordingObserver obs;
    uint64_t now = 1'000'000'000;
    ProgressReporter p(&obs, std::nullopt, [&] { return now; });
    p.update(1); // first tick
    now += ProgressReporter::TICK_INTERVAL_NS / 2;
    p.update(2); // throttled
    now += ProgressReporter::TICK_INTERVAL_NS;
    p.update(3); // tick
    p.update(4); // throttled
    p.finish();
    EXPECT_EQ(obs.ticks, 2);
    EXPECT_TRUE(obs.percents.empty());
    EXPECT_EQ(obs.finished, 1);
}

TEST_F(ProgressTest, NullObserverIsIgnored)
{
    ProgressReporter p(nullptr, 10);
    EXPECT_NO_THROW(p.update(5));
    EXPECT_NO_THROW(p.finish());
}

TEST_F(ProgressTest, ConsoleProgressOutput)
{
    std::FILE *f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    {
        ConsoleProgress console(f);
        ProgressReporter p(&console, 2);
        p.update(1);
        p.finish();
    }
    std::rewind(f);
    std::string out;
    char buf[256];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
        out.append(buf, n);
    std::fclose(f);
    EXPECT_THAT(out, HasSubstr("\rCopied 50%"));
    EXPECT_THAT(out, HasSubstr("\rCopied 100%"));
    EXPECT_EQ(out.back(), '\n');
}
