#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex log_mutex;
LogSettings log_settings;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO ";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

void rexec_log_configure(const LogSettings& settings) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_settings = settings;
}

std::string rexec_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_settings.path.empty()) return log_settings.path;
    return (platform::temp_dir() / "rexec.log").string();
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

void rexec_log(LogLevel level, const std::string& msg) {
    std::string path = rexec_log_path();

    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_settings.level) return;

    std::string line = fmt::format("[{}] {} {}", timestamp(), level_tag(level), msg);
    std::ofstream out(path, std::ios::app);
    if (out) out << line << "\n";
    if (log_settings.mirror_stderr) std::cerr << line << "\n";
}

void rexec_log_exec(const std::string& label, const std::string& cmd,
                    const CommandResult& r) {
    rexec_debug(fmt::format("{} CMD: {}", label, cmd.substr(0, LOG_EXCERPT_CHARS)));
    rexec_debug(fmt::format("{} exit={} timed_out={} {}ms stdout({})={}", label,
                            r.exit_code ? std::to_string(*r.exit_code) : "none",
                            r.timed_out, r.duration.count(), r.stdout_data.size(),
                            r.stdout_data.substr(0, LOG_EXCERPT_CHARS)));
    if (!r.stderr_data.empty())
        rexec_debug(fmt::format("{} stderr={}", label,
                                r.stderr_data.substr(0, LOG_EXCERPT_CHARS)));
}
