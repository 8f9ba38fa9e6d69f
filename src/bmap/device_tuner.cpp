/**
 * @file device_tuner.cpp
 * @brief sysfs-based block-device tuning.
 */
#include "bmc_service.hpp"
#include "bmap/device_tuner.hpp"

#include <fstream>
#include <regex>
#include <sstream>

namespace bmapcopy::bmap
{

namespace fs = std::filesystem;

namespace
{

std::optional<std::string> read_pseudo_file(const fs::path &path)
{
    std::ifstream in(path);
    if (!in)
    {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
    {
        return std::nullopt;
    }
    return std::string(bmapcopy::format_tools::trim_whitespace(ss.str()));
}

bool write_pseudo_file(const fs::path &path, const std::string &value)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out)
    {
        return false;
    }
    out << value;
    out.flush();
    return static_cast<bool>(out);
}

} // namespace

std::optional<std::string> parse_active_scheduler(std::string_view text)
{
    static const std::regex kActive(R"(.*\[(.+)\].*)");
    const std::string s(bmapcopy::format_tools::trim_whitespace(text));
    std::smatch m;
    if (std::regex_match(s, m, kActive))
    {
        return m[1].str();
    }
    return std::nullopt;
}

SysfsDeviceTuner::SysfsDeviceTuner(DeviceTuningState paths, TunerOptions options)
    : m_state(std::move(paths)), m_options(std::move(options))
{
}

std::unique_ptr<SysfsDeviceTuner> SysfsDeviceTuner::for_device(unsigned major, unsigned minor,
                                                               TunerOptions options)
{
    fs::path base = options.sysfs_root / "dev" / "block" / fmt::format("{}:{}", major, minor);
    std::error_code ec;
    if (!fs::exists(base / "queue", ec))
    {
        // A partition: the queue belongs to the whole disk one level up.
        base = base / "..";
    }
    DeviceTuningState state;
    state.scheduler_path = base / "queue" / "scheduler";
    state.ratio_path = base / "bdi" / "max_ratio";
    LOGGER_DEBUG("[tuner] device {}:{} uses '{}' and '{}'", major, minor,
                 state.scheduler_path.string(), state.ratio_path.string());
    return std::make_unique<SysfsDeviceTuner>(std::move(state), std::move(options));
}

void SysfsDeviceTuner::warn(const fs::path &path, std::string message)
{
    LOGGER_WARN("[tuner] {}", message);
    m_warnings.push_back(TuningWarning{path.string(), std::move(message)});
}

void SysfsDeviceTuner::apply()
{
    if (auto current = read_pseudo_file(m_state.scheduler_path))
    {
        if (auto active = parse_active_scheduler(*current))
        {
            if (write_pseudo_file(m_state.scheduler_path, m_options.scheduler))
            {
                m_state.prior_scheduler = *active;
                LOGGER_DEBUG("[tuner] switched I/O scheduler from '{}' to '{}'", *active,
                             m_options.scheduler);
            }
            else
            {
                warn(m_state.scheduler_path,
                     fmt::format("cannot switch to the '{}' I/O scheduler: '{}' is not writable",
                                 m_options.scheduler, m_state.scheduler_path.string()));
            }
        }
        else
        {
            warn(m_state.scheduler_path,
                 fmt::format("cannot find the active I/O scheduler in '{}'",
                             m_state.scheduler_path.string()));
        }
    }
    else
    {
        warn(m_state.scheduler_path,
             fmt::format("cannot read '{}'", m_state.scheduler_path.string()));
    }

    if (auto current = read_pseudo_file(m_state.ratio_path))
    {
        if (write_pseudo_file(m_state.ratio_path, m_options.max_ratio))
        {
            m_state.prior_ratio = *current;
            LOGGER_DEBUG("[tuner] set max. I/O ratio from '{}' to '{}'", *current,
                         m_options.max_ratio);
        }
        else
        {
            warn(m_state.ratio_path, fmt::format("cannot set max. I/O ratio to '{}'",
                                                 m_options.max_ratio));
        }
    }
    else
    {
        warn(m_state.ratio_path, fmt::format("cannot read '{}'", m_state.ratio_path.string()));
    }
}

void SysfsDeviceTuner::restore()
{
    std::optional<ErrorInfo> first_failure;
    auto fail = [&](const fs::path &path, std::string message)
    {
        LOGGER_ERROR("[tuner] {}", message);
        if (!first_failure)
        {
            ErrorInfo info;
            info.kind = ErrorKind::Restore;
            info.message = std::move(message);
            info.path = path.string();
            first_failure = std::move(info);
        }
    };

    if (m_state.prior_scheduler)
    {
        if (write_pseudo_file(m_state.scheduler_path, *m_state.prior_scheduler))
        {
            m_state.prior_scheduler.reset();
        }
        else
        {
            fail(m_state.scheduler_path,
                 fmt::format("cannot restore the '{}' I/O scheduler", *m_state.prior_scheduler));
        }
    }
    if (m_state.prior_ratio)
    {
        if (write_pseudo_file(m_state.ratio_path, *m_state.prior_ratio))
        {
            m_state.prior_ratio.reset();
        }
        else
        {
            fail(m_state.ratio_path,
                 fmt::format("cannot set max. I/O ratio back to '{}'", *m_state.prior_ratio));
        }
    }

    if (first_failure)
    {
        throw_error(std::move(*first_failure));
    }
}

} // namespace bmapcopy::bmap
