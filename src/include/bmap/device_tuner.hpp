#pragma once
/**
 * @file device_tuner.hpp
 * @brief Temporary block-device I/O tuning around a copy run.
 *
 * The engine calls apply() before the pipeline starts and restore() on every exit
 * from the copy, successful or not. The capacity check is the engine's own.
 * apply() is best effort and only records TuningWarnings; restore() failures are
 * fatal RestoreErrors.
 */
#include "bmapcopy_core_export.h"
#include "bmap/errors.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bmapcopy::bmap
{

class BMAPCOPY_CORE_EXPORT DeviceTuner
{
  public:
    virtual ~DeviceTuner() = default;

    virtual void apply() = 0;
    /** @throws RestoreError if a recorded setting could not be written back. */
    virtual void restore() = 0;

    [[nodiscard]] virtual const std::vector<TuningWarning> &warnings() const noexcept = 0;
};

/** @brief Tuner for destinations that need none. */
class BMAPCOPY_CORE_EXPORT NoopDeviceTuner : public DeviceTuner
{
  public:
    void apply() override {}
    void restore() override {}
    [[nodiscard]] const std::vector<TuningWarning> &warnings() const noexcept override
    {
        return m_warnings;
    }

  private:
    std::vector<TuningWarning> m_warnings;
};

struct TunerOptions
{
    std::string scheduler = "noop";
    std::string max_ratio = "1";
    std::filesystem::path sysfs_root = "/sys";
};

/**
 * @brief The two pseudo-files a SysfsDeviceTuner touches, with the prior values it
 *        replaced. A prior value is present only if the new one was written.
 */
struct DeviceTuningState
{
    std::filesystem::path scheduler_path;
    std::filesystem::path ratio_path;
    std::optional<std::string> prior_scheduler;
    std::optional<std::string> prior_ratio;
};

/**
 * @class SysfsDeviceTuner
 * @brief Switches the I/O scheduler and the dirty-page ratio of a block device.
 *
 * Files are looked up under `<sysfs_root>/dev/block/MAJ:MIN/`; when that entry has
 * no `queue` directory (a partition), its parent disk is used.
 */
class BMAPCOPY_CORE_EXPORT SysfsDeviceTuner : public DeviceTuner
{
  public:
    explicit SysfsDeviceTuner(DeviceTuningState paths, TunerOptions options = {});

    static std::unique_ptr<SysfsDeviceTuner> for_device(unsigned major, unsigned minor,
                                                        TunerOptions options = {});

    void apply() override;
    void restore() override;

    [[nodiscard]] const std::vector<TuningWarning> &warnings() const noexcept override
    {
        return m_warnings;
    }
    [[nodiscard]] const DeviceTuningState &state() const noexcept { return m_state; }

  private:
    void warn(const std::filesystem::path &path, std::string message);

    DeviceTuningState m_state;
    TunerOptions m_options;
    std::vector<TuningWarning> m_warnings;
};

/**
 * @brief Extracts the active entry of a scheduler file, e.g. "cfq" from
 *        "noop deadline [cfq]".
 */
BMAPCOPY_CORE_EXPORT std::optional<std::string> parse_active_scheduler(std::string_view text);

} // namespace bmapcopy::bmap
