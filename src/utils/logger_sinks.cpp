#include "utils/logger_sinks.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace bmapcopy::utils
{

const char *log_level_name(int level) noexcept
{
    static constexpr std::array<const char *, 6> kNames = {"TRACE", "DEBUG", "INFO",
                                                           "WARN",  "ERROR", "SYSTEM"};
    if (level < 0 || static_cast<size_t>(level) >= kNames.size())
    {
        return "UNK";
    }
    return kNames[static_cast<size_t>(level)];
}

std::string render_log_line(const LogMessage &msg)
{
    return fmt::format("[LOGGER] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n",
                       log_level_name(msg.level),
                       bmapcopy::format_tools::formatted_time(msg.timestamp), msg.process_id,
                       msg.thread_id, std::string_view(msg.body.data(), msg.body.size()));
}

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::write_line(std::string_view line)
{
    std::fwrite(line.data(), 1, line.size(), stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        const int err = errno;
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path, std::strerror(err)));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
    }
}

void FileSink::write_line(std::string_view line)
{
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_EX);
    }
    // Unlocks on every exit path.
    auto unlock = bmapcopy::basics::make_scope_guard(
        [this]()
        {
            if (m_use_flock)
            {
                ::flock(m_fd, LOCK_UN);
            }
        });

    size_t done = 0;
    while (done < line.size())
    {
        const ssize_t n = ::write(m_fd, line.data() + done, line.size() - done);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(),
                                    fmt::format("cannot write to log file '{}'", m_path));
        }
        done += static_cast<size_t>(n);
    }
}

void FileSink::flush()
{
    ::fsync(m_fd);
}

} // namespace bmapcopy::utils
