#include "bmc_base.hpp"
#include "bmap/progress.hpp"

namespace bmapcopy::bmap
{

ProgressReporter::ProgressReporter(ProgressObserver *observer,
                                   std::optional<uint64_t> total_blocks, Clock clock)
    : m_observer(observer), m_total(total_blocks), m_clock(std::move(clock))
{
    if (!m_clock)
    {
        m_clock = [] { return bmapcopy::platform::monotonic_time_ns(); };
    }
}

void ProgressReporter::update(uint64_t blocks_written)
{
    if (m_observer == nullptr)
    {
        return;
    }
    if (m_total)
    {
        int percent = 100;
        if (*m_total > 0)
        {
            const uint64_t done = blocks_written < *m_total ? blocks_written : *m_total;
            percent = static_cast<int>(done * 100 / *m_total);
        }
        if (percent != m_last_percent)
        {
            m_last_percent = percent;
            m_observer->on_percent(percent);
        }
        return;
    }

    const uint64_t now = m_clock();
    if (m_last_tick_ns && now - *m_last_tick_ns < TICK_INTERVAL_NS)
    {
        return;
    }
    m_last_tick_ns = now;
    m_observer->on_tick();
}

void ProgressReporter::finish()
{
    if (m_observer == nullptr)
    {
        return;
    }
    if (m_total && m_last_percent != 100)
    {
        m_last_percent = 100;
        m_observer->on_percent(100);
    }
    m_observer->on_finished();
}

// ============================================================================
// ConsoleProgress
// ============================================================================

void ConsoleProgress::on_percent(int percent)
{
    fmt::print(m_out, "\rCopied {}%", percent);
    std::fflush(m_out);
    m_printed = true;
}

void ConsoleProgress::on_tick()
{
    static constexpr char kWheel[] = {'-', '\\', '|', '/'};
    fmt::print(m_out, "\r{}", kWheel[m_wheel_pos++ % sizeof(kWheel)]);
    std::fflush(m_out);
    m_printed = true;
}

void ConsoleProgress::on_finished()
{
    if (m_printed)
    {
        fmt::print(m_out, "\n");
        std::fflush(m_out);
    }
}

} // namespace bmapcopy::bmap
