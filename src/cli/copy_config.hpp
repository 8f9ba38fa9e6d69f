#pragma once
/**
 * @file copy_config.hpp
 * @brief bmapcopy tool configuration, loaded from an optional JSON file.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "copy": {
 *     "verify":                true,
 *     "sync":                  true,
 *     "batch_bytes":           1048576,
 *     "queue_length":          2,
 *     "fsync_watermark_bytes": 6291456
 *   },
 *   "tuning": {
 *     "enabled":    true,
 *     "scheduler":  "noop",
 *     "max_ratio":  1,
 *     "sysfs_root": "/sys"
 *   },
 *   "logging": {
 *     "level": "info",
 *     "file":  "/var/log/bmapcopy.log"
 *   },
 *   "progress": true
 * }
 * @endcode
 *
 * Every key is optional. `queue_length` and `fsync_watermark_bytes` default to the
 * engine's per-destination values when absent. Command-line flags override the file.
 */

#include "bmap/copy_engine.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace bmapcopy::cli
{

struct CopyConfig
{
    bool verify{true};
    bool sync{true};
    uint64_t batch_bytes{bmap::DEFAULT_BATCH_BYTES};
    std::optional<size_t> queue_length;
    std::optional<uint64_t> fsync_watermark_bytes;

    bool tuning_enabled{true};
    std::string scheduler{"noop"};
    std::string max_ratio{"1"};
    std::string sysfs_root{"/sys"};

    std::string log_level{"info"};
    std::string log_file; ///< Empty: log to the console

    bool progress{true};

    /**
     * @brief Load and validate a JSON config file.
     * @throws std::runtime_error on file-not-found, parse error, or an invalid field.
     */
    static CopyConfig from_json_file(const std::string &path);

    /** @brief Same as from_json_file() for an already parsed document. */
    static CopyConfig from_json(const nlohmann::json &j, const std::string &origin);

    /** @brief Engine options for this configuration. The progress observer is left unset. */
    [[nodiscard]] bmap::CopyOptions to_copy_options() const;
};

} // namespace bmapcopy::cli
