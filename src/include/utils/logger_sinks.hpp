#pragma once
/**
 * @file logger_sinks.hpp
 * @brief Destinations for Logger output: stderr or a single append-only file.
 *
 * Sinks are only touched by the Logger worker thread (under its sink mutex), so they
 * do no locking of their own.
 */

#include "bmc_base.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace bmapcopy::utils
{

/// One formatted log event, as queued by the Logger front end.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Logger::Level as int; keeps this header free of logger.hpp.
    fmt::memory_buffer body;
};

/// Short upper-case name of a level ("INFO", "WARN", ...); "UNK" when out of range.
const char *log_level_name(int level) noexcept;

/// Renders "[LOGGER] [LEVEL ] [time] [PID:.. TID:..] body\n".
std::string render_log_line(const LogMessage &msg);

class Sink
{
  public:
    virtual ~Sink() = default;

    void write(const LogMessage &msg) { write_line(render_log_line(msg)); }
    virtual void flush() = 0;
    virtual std::string description() const = 0;

  protected:
    virtual void write_line(std::string_view line) = 0;
};

class ConsoleSink : public Sink
{
  public:
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }

  protected:
    void write_line(std::string_view line) override;
};

/**
 * @class FileSink
 * @brief Appends log lines to a file, optionally holding an advisory `flock` per line
 *        so that several bmapcopy processes can share one log file.
 */
class FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void flush() override;
    std::string description() const override { return "File: " + m_path; }

  protected:
    /// @throws std::system_error on a failed or short write.
    void write_line(std::string_view line) override;

  private:
    std::string m_path;
    bool m_use_flock;
    int m_fd = -1;
};

} // namespace bmapcopy::utils
