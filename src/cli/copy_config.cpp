#include "copy_config.hpp"
#include "bmc_service.hpp"

#include <fstream>

namespace bmapcopy::cli
{

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

[[noreturn]] void invalid(const std::string &key, const std::string &what,
                          const std::string &origin)
{
    throw std::runtime_error("Copy config: invalid '" + key + "' in '" + origin + "': " + what);
}

const nlohmann::json *section(const nlohmann::json &j, const char *name, const std::string &origin)
{
    if (!j.contains(name))
        return nullptr;
    if (!j[name].is_object())
        invalid(name, "must be a JSON object", origin);
    return &j[name];
}

bool get_bool(const nlohmann::json &j, const char *key, bool def, const std::string &origin)
{
    if (!j.contains(key))
        return def;
    if (!j[key].is_boolean())
        invalid(key, "must be true or false", origin);
    return j[key].get<bool>();
}

std::optional<uint64_t> get_u64(const nlohmann::json &j, const char *key,
                                const std::string &origin)
{
    if (!j.contains(key))
        return std::nullopt;
    if (!j[key].is_number_unsigned())
        invalid(key, "must be a non-negative integer", origin);
    return j[key].get<uint64_t>();
}

std::string get_string(const nlohmann::json &j, const char *key, const std::string &def,
                       const std::string &origin)
{
    if (!j.contains(key))
        return def;
    if (!j[key].is_string())
        invalid(key, "must be a string", origin);
    return j[key].get<std::string>();
}

} // anonymous namespace

// ============================================================================
// CopyConfig
// ============================================================================

CopyConfig CopyConfig::from_json(const nlohmann::json &j, const std::string &origin)
{
    if (!j.is_object())
        throw std::runtime_error("Copy config: top level of '" + origin +
                                 "' must be a JSON object");

    CopyConfig cfg;

    if (const auto *c = section(j, "copy", origin))
    {
        cfg.verify = get_bool(*c, "verify", cfg.verify, origin);
        cfg.sync = get_bool(*c, "sync", cfg.sync, origin);
        if (auto v = get_u64(*c, "batch_bytes", origin))
        {
            if (*v == 0)
                invalid("batch_bytes", "must be greater than zero", origin);
            cfg.batch_bytes = *v;
        }
        if (auto v = get_u64(*c, "queue_length", origin))
        {
            if (*v == 0)
                invalid("queue_length", "must be at least 1", origin);
            cfg.queue_length = static_cast<size_t>(*v);
        }
        cfg.fsync_watermark_bytes = get_u64(*c, "fsync_watermark_bytes", origin);
    }

    if (const auto *t = section(j, "tuning", origin))
    {
        cfg.tuning_enabled = get_bool(*t, "enabled", cfg.tuning_enabled, origin);
        cfg.scheduler = get_string(*t, "scheduler", cfg.scheduler, origin);
        if (cfg.scheduler.empty())
            invalid("scheduler", "must not be empty", origin);
        if (t->contains("max_ratio"))
        {
            const auto &r = (*t)["max_ratio"];
            if (!r.is_number_unsigned() || r.get<uint64_t>() > 100)
                invalid("max_ratio", "must be an integer between 0 and 100", origin);
            cfg.max_ratio = std::to_string(r.get<uint64_t>());
        }
        cfg.sysfs_root = get_string(*t, "sysfs_root", cfg.sysfs_root, origin);
    }

    if (const auto *l = section(j, "logging", origin))
    {
        cfg.log_level = get_string(*l, "level", cfg.log_level, origin);
        if (!utils::Logger::parse_level(cfg.log_level))
            invalid("level", "unknown log level '" + cfg.log_level + "'", origin);
        cfg.log_file = get_string(*l, "file", cfg.log_file, origin);
    }

    cfg.progress = get_bool(j, "progress", cfg.progress, origin);
    return cfg;
}

CopyConfig CopyConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Copy config: cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Copy config: JSON parse error in '" + path + "': " + e.what());
    }
    return from_json(j, path);
}

bmap::CopyOptions CopyConfig::to_copy_options() const
{
    bmap::CopyOptions opts;
    opts.verify = verify;
    opts.sync = sync;
    opts.batch_bytes = batch_bytes;
    opts.queue_length = queue_length;
    opts.sync_watermark_bytes = fsync_watermark_bytes;
    opts.tune_device = tuning_enabled;
    opts.tuner.scheduler = scheduler;
    opts.tuner.max_ratio = max_ratio;
    opts.tuner.sysfs_root = sysfs_root;
    return opts;
}

} // namespace bmapcopy::cli
