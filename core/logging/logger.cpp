#include "logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iomanip>

namespace statforge {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::string Logger::role_ = "ui";
std::mutex Logger::mutex_;

namespace {

// One write(2) per line so output of the ui, the supervisor and the workers
// does not interleave mid-line on the shared stderr.
void write_line(const std::string& line) {
    const char* data = line.data();
    size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t n = ::write(STDERR_FILENO, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
}

} // namespace

void Logger::init(Level threshold, const std::string& role) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = threshold;
    role_ = role;
}

void Logger::set_level(Level level) {
    threshold_ = level;
}

Level Logger::level() {
    return threshold_;
}

const std::string& Logger::role() {
    return role_;
}

void Logger::log(Level level, const char* /*file*/, int /*line*/, const std::string& message) {
    if (level < threshold_ || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream line;
    line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
         << " [" << role_ << ":" << ::getpid() << "] "
         << level_tag(level) << " " << message << "\n";

    write_line(line.str());
}

const char* level_tag(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "[DEBUG]";
        case Level::LVL_INFO:  return "[INFO] ";
        case Level::LVL_WARN:  return "[WARN] ";
        case Level::LVL_ERROR: return "[ERROR]";
        default: return "";
    }
}

Level string_to_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;
}

} // namespace logging
} // namespace statforge
