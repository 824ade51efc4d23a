#include "container_service.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

namespace {

bool mentions_missing_container(const std::string& text) {
    std::string lower = to_lower(text);
    return lower.find("does not exist") != std::string::npos ||
           lower.find("not found") != std::string::npos;
}

} // namespace

ContainerService::ContainerService(SessionManager& session, const SecurityGate& gate)
    : session_(session), gate_(gate) {
}

std::string ContainerService::exec_command(int ctid, const std::string& command) {
    return fmt::format("pct exec {} -- bash -c {}", ctid, shell_quote(command));
}

Result<CommandResult> ContainerService::run_pct(const std::string& command, int ctid) {
    auto r = session_.exec(command, CONTAINER_OP_TIMEOUT_SECS);
    if (r.is_err()) return r;
    if (r.value.timed_out) {
        return Result<CommandResult>::Err(ErrorKind::RemoteIo,
            fmt::format("'{}' timed out after {}s", command, CONTAINER_OP_TIMEOUT_SECS));
    }
    if (!r.value.succeeded()) {
        std::string err = r.value.stderr_data.empty() ? r.value.stdout_data : r.value.stderr_data;
        trim(err);
        if (mentions_missing_container(err)) {
            return Result<CommandResult>::Err(ErrorKind::RemoteIo,
                fmt::format("Container {} not found or not accessible: {}", ctid, err));
        }
        return Result<CommandResult>::Err(ErrorKind::RemoteIo,
            fmt::format("'{}' failed (exit {}): {}", command, *r.value.exit_code, err));
    }
    return r;
}

Result<CommandResult> ContainerService::exec(int64_t ctid, const std::string& command,
                                             std::optional<int64_t> timeout_secs) {
    auto id = SecurityGate::validate_container_id(ctid);
    if (id.is_err()) return Result<CommandResult>::Err(id);
    auto valid = gate_.validate_command(command);
    if (valid.is_err()) return Result<CommandResult>::Err(valid);

    // The pct wrapper and quoting count against the same limit
    std::string wrapped = exec_command(id.value, command);
    auto limit = static_cast<size_t>(gate_.config().max_command_length);
    if (wrapped.size() > limit) {
        return Result<CommandResult>::Err(ErrorKind::InvalidArgument,
            fmt::format("Command too long: {} characters, {} once wrapped for container {} "
                        "(max {})", command.size(), wrapped.size(), id.value, limit));
    }

    rexec_debug(fmt::format("Executing in container {}: {}", id.value, command.substr(0, 100)));
    auto r = session_.exec(wrapped, timeout_secs);
    if (r.is_ok() && !r.value.succeeded() && !r.value.timed_out &&
        r.value.stdout_data.empty() && mentions_missing_container(r.value.stderr_data)) {
        return Result<CommandResult>::Err(ErrorKind::RemoteIo,
            fmt::format("Container {} not found or not accessible", id.value));
    }
    return r;
}

std::vector<ContainerInfo> ContainerService::parse_list(const std::string& output) {
    std::vector<ContainerInfo> containers;
    std::istringstream in(output);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty()) continue;
        if (header) {
            header = false;
            continue;
        }

        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string part;
        while (fields >> part) parts.push_back(part);
        if (parts.size() < 2) continue;

        auto ctid = safe_stoll(parts[0]);
        if (!ctid) continue;
        ContainerInfo info;
        info.ctid = static_cast<int>(*ctid);
        info.status = parts[1];
        info.name = parts.size() >= 3 ? parts.back() : "";
        containers.push_back(info);
    }
    return containers;
}

std::string ContainerService::parse_status(const std::string& output) {
    std::string lower = to_lower(output);
    if (lower.find("running") != std::string::npos) return "running";
    if (lower.find("stopped") != std::string::npos) return "stopped";
    return "unknown";
}

Result<std::vector<ContainerInfo>> ContainerService::list() {
    auto r = run_pct("pct list", 0);
    if (r.is_err()) return Result<std::vector<ContainerInfo>>::Err(r);
    return Result<std::vector<ContainerInfo>>::Ok(parse_list(r.value.stdout_data));
}

Result<std::string> ContainerService::status(int64_t ctid) {
    auto id = SecurityGate::validate_container_id(ctid);
    if (id.is_err()) return Result<std::string>::Err(id);
    auto r = run_pct(fmt::format("pct status {}", id.value), id.value);
    if (r.is_err()) return Result<std::string>::Err(r);
    return Result<std::string>::Ok(parse_status(r.value.stdout_data));
}

Result<void> ContainerService::start(int64_t ctid) {
    auto id = SecurityGate::validate_container_id(ctid);
    if (id.is_err()) return Result<void>::Err(id);
    rexec_log(fmt::format("Starting container {}", id.value));
    auto r = run_pct(fmt::format("pct start {}", id.value), id.value);
    if (r.is_err()) return Result<void>::Err(r);
    return Result<void>::Ok();
}

Result<void> ContainerService::stop(int64_t ctid) {
    auto id = SecurityGate::validate_container_id(ctid);
    if (id.is_err()) return Result<void>::Err(id);
    rexec_log(fmt::format("Stopping container {}", id.value));
    auto r = run_pct(fmt::format("pct stop {}", id.value), id.value);
    if (r.is_err()) return Result<void>::Err(r);
    return Result<void>::Ok();
}

Result<bool> ContainerService::file_exists(int64_t ctid, const std::string& path) {
    auto id = SecurityGate::validate_container_id(ctid);
    if (id.is_err()) return Result<bool>::Err(id);

    auto r = session_.exec(fmt::format("pct exec {} -- test -e {}", id.value, shell_quote(path)),
                           CONTAINER_OP_TIMEOUT_SECS);
    if (r.is_err()) return Result<bool>::Err(r);
    if (r.value.timed_out) {
        return Result<bool>::Err(ErrorKind::RemoteIo,
                                 fmt::format("Checking {} in container {} timed out", path, id.value));
    }
    if (*r.value.exit_code == 0) return Result<bool>::Ok(true);
    if (*r.value.exit_code == 1) return Result<bool>::Ok(false);
    return Result<bool>::Err(ErrorKind::RemoteIo,
        fmt::format("Container {} not found or not accessible: {}", id.value, r.value.stderr_data));
}

Result<std::string> ContainerService::pull_file(int64_t ctid, const std::string& path,
                                                uint64_t max_bytes) {
    auto id = SecurityGate::validate_container_id(ctid);
    if (id.is_err()) return Result<std::string>::Err(id);

    std::string tmp = CONTAINER_TEMP_PREFIX + random_hex(8);
    auto pulled = run_pct(fmt::format("pct pull {} {} {}", id.value, shell_quote(path),
                                      shell_quote(tmp)), id.value);
    if (pulled.is_err()) {
        auto cleanup = session_.remove_file(tmp);
        if (cleanup.is_err()) rexec_warn("Could not remove host temp file " + tmp + ": " + cleanup.error);
        return Result<std::string>::Err(pulled);
    }

    auto data = session_.read_file(tmp, max_bytes);
    auto cleanup = session_.remove_file(tmp);
    if (cleanup.is_err()) rexec_warn("Could not remove host temp file " + tmp + ": " + cleanup.error);
    return data;
}

Result<void> ContainerService::push_file(int64_t ctid, const std::string& path,
                                         const std::string& data, unsigned mode) {
    auto id = SecurityGate::validate_container_id(ctid);
    if (id.is_err()) return Result<void>::Err(id);

    std::string tmp = CONTAINER_TEMP_PREFIX + random_hex(8);
    auto staged = session_.write_file_atomic(tmp, data, 0600);
    if (staged.is_err()) return staged;

    auto pushed = run_pct(fmt::format("pct push {} {} {} --perms {:04o}", id.value,
                                      shell_quote(tmp), shell_quote(path), mode), id.value);
    auto cleanup = session_.remove_file(tmp);
    if (cleanup.is_err()) rexec_warn("Could not remove host temp file " + tmp + ": " + cleanup.error);
    if (pushed.is_err()) return Result<void>::Err(pushed);
    return Result<void>::Ok();
}
