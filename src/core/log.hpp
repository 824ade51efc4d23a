#pragma once

#include <string>
#include <optional>
#include "types.hpp"

enum class LogLevel { Debug, Info, Warn, Error };

struct LogSettings {
    std::string path;              // empty = <tmp>/rexec.log
    LogLevel level = LogLevel::Info;
    bool mirror_stderr = false;    // stdout carries responses, never log there
};

void rexec_log_configure(const LogSettings& settings);
std::string rexec_log_path();

std::optional<LogLevel> parse_log_level(const std::string& name);

// Append a timestamped line to the log file.
void rexec_log(LogLevel level, const std::string& msg);

inline void rexec_log(const std::string& msg) { rexec_log(LogLevel::Info, msg); }
inline void rexec_debug(const std::string& msg) { rexec_log(LogLevel::Debug, msg); }
inline void rexec_warn(const std::string& msg) { rexec_log(LogLevel::Warn, msg); }
inline void rexec_error(const std::string& msg) { rexec_log(LogLevel::Error, msg); }

void rexec_log_exec(const std::string& label, const std::string& cmd,
                    const CommandResult& r);
