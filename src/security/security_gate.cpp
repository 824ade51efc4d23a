#include "security_gate.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <vector>

SecurityGate::SecurityGate(const SecurityConfig& config) : config_(config) {}

Result<void> SecurityGate::check_risk_accepted() const {
    if (!config_.risk_accepted) {
        return Result<void>::Err(ErrorKind::PermissionDenied,
            "Remote execution is disabled: set I_ACCEPT_RISKS=true "
            "(or security.accept_risks) to acknowledge the risks");
    }
    return Result<void>::Ok();
}

Result<std::string> SecurityGate::validate_path(const std::string& path) const {
    std::string stripped = path;
    trim(stripped);
    if (stripped.empty()) {
        return Result<std::string>::Err(ErrorKind::PathValidation, "Path cannot be empty");
    }
    if (path.find('\0') != std::string::npos) {
        return Result<std::string>::Err(ErrorKind::PathValidation,
                                        "Path cannot contain null bytes");
    }
    if (path.size() > static_cast<size_t>(config_.max_path_length)) {
        return Result<std::string>::Err(ErrorKind::PathValidation,
            fmt::format("Path too long: {} characters (max {})",
                        path.size(), config_.max_path_length));
    }

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string seg = path.substr(start, slash - start);
        if (seg == "..") {
            return Result<std::string>::Err(ErrorKind::PathValidation,
                "Path cannot contain '..' (path traversal not allowed)");
        }
        if (!seg.empty() && seg != ".") segments.push_back(seg);
        start = slash + 1;
    }

    bool absolute = path[0] == '/';
    std::string normalized = absolute ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) normalized += '/';
        normalized += segments[i];
    }
    if (normalized.empty()) normalized = ".";
    return Result<std::string>::Ok(normalized);
}

Result<unsigned> SecurityGate::validate_permissions(int64_t value) {
    if (value < 0 || value > 777) {
        return Result<unsigned>::Err(ErrorKind::InvalidArgument,
            fmt::format("Permissions must be between 000 and 777, got {}", value));
    }
    unsigned mode = 0;
    unsigned shift = 0;
    for (int64_t rest = value; rest > 0; rest /= 10, shift += 3) {
        int digit = static_cast<int>(rest % 10);
        if (digit > 7) {
            return Result<unsigned>::Err(ErrorKind::InvalidArgument,
                fmt::format("Invalid permissions {}: each digit must be 0-7 (e.g. 644, 755)",
                            value));
        }
        mode |= static_cast<unsigned>(digit) << shift;
    }
    return Result<unsigned>::Ok(mode);
}

Result<void> SecurityGate::validate_command(const std::string& command) const {
    std::string stripped = command;
    trim(stripped);
    if (stripped.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Command cannot be empty");
    }
    if (command.size() > static_cast<size_t>(config_.max_command_length)) {
        return Result<void>::Err(ErrorKind::InvalidArgument,
            fmt::format("Command too long: {} characters (max {})",
                        command.size(), config_.max_command_length));
    }
    return Result<void>::Ok();
}

Result<int> SecurityGate::validate_timeout(std::optional<int64_t> timeout_secs) const {
    if (!timeout_secs) return Result<int>::Ok(config_.default_timeout);
    if (*timeout_secs <= 0 || *timeout_secs > config_.max_timeout) {
        return Result<int>::Err(ErrorKind::InvalidArgument,
            fmt::format("Timeout must be between 1 and {} seconds, got {}",
                        config_.max_timeout, *timeout_secs));
    }
    return Result<int>::Ok(static_cast<int>(*timeout_secs));
}

Result<void> SecurityGate::check_file_size(uint64_t bytes) const {
    if (bytes > static_cast<uint64_t>(config_.max_file_size)) {
        return Result<void>::Err(ErrorKind::SizeLimitExceeded,
            fmt::format("File too large: {} (max {})", format_bytes(bytes),
                        format_bytes(static_cast<uint64_t>(config_.max_file_size))));
    }
    return Result<void>::Ok();
}

Result<int> SecurityGate::validate_container_id(int64_t ctid) {
    if (ctid < MIN_CONTAINER_ID || ctid > MAX_CONTAINER_ID) {
        return Result<int>::Err(ErrorKind::InvalidArgument,
            fmt::format("Container ID must be between {} and {}, got {}",
                        MIN_CONTAINER_ID, MAX_CONTAINER_ID, ctid));
    }
    return Result<int>::Ok(static_cast<int>(ctid));
}
