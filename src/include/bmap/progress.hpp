#pragma once
/**
 * @file progress.hpp
 * @brief Progress reporting for the writer task.
 */
#include "bmapcopy_core_export.h"

#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>

namespace bmapcopy::bmap
{

/**
 * @brief Receives copy progress. Called from the writer task only.
 */
class BMAPCOPY_CORE_EXPORT ProgressObserver
{
  public:
    virtual ~ProgressObserver() = default;

    /** @brief Percentage of the mapped blocks written, when the total is known. */
    virtual void on_percent(int percent) = 0;
    /** @brief Liveness tick when the total is unknown. */
    virtual void on_tick() = 0;
    /** @brief Called once after the last block has been written. */
    virtual void on_finished() {}
};

/**
 * @class ProgressReporter
 * @brief Turns block counts into observer calls.
 *
 * With a known total, the observer sees each percentage once. Without one, ticks
 * are throttled to one per `TICK_INTERVAL_NS`.
 */
class BMAPCOPY_CORE_EXPORT ProgressReporter
{
  public:
    static constexpr uint64_t TICK_INTERVAL_NS = 250'000'000;

    using Clock = std::function<uint64_t()>;

    /**
     * @param observer      May be null, in which case update() does nothing.
     * @param total_blocks  Mapped block count, if known.
     * @param clock         Monotonic nanoseconds; defaults to platform::monotonic_time_ns.
     */
    ProgressReporter(ProgressObserver *observer, std::optional<uint64_t> total_blocks,
                     Clock clock = {});

    void update(uint64_t blocks_written);
    void finish();

  private:
    ProgressObserver *m_observer;
    std::optional<uint64_t> m_total;
    Clock m_clock;
    int m_last_percent = -1;
    std::optional<uint64_t> m_last_tick_ns;
};

/**
 * @class ConsoleProgress
 * @brief Renders "\rCopied N%" or a rotating "-\|/" wheel on a stdio stream.
 */
class BMAPCOPY_CORE_EXPORT ConsoleProgress : public ProgressObserver
{
  public:
    explicit ConsoleProgress(std::FILE *out = stderr) : m_out(out) {}

    void on_percent(int percent) override;
    void on_tick() override;
    void on_finished() override;

  private:
    std::FILE *m_out;
    unsigned m_wheel_pos = 0;
    bool m_printed = false;
};

} // namespace bmapcopy::bmap
