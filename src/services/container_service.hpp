#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <security/security_gate.hpp>
#include <ssh/session_manager.hpp>

struct ContainerInfo {
    int ctid = 0;
    std::string status;
    std::string name;
};

// Proxmox LXC containers on the managed host, driven through `pct`.
class ContainerService {
public:
    ContainerService(SessionManager& session, const SecurityGate& gate);

    Result<CommandResult> exec(int64_t ctid, const std::string& command,
                               std::optional<int64_t> timeout_secs);
    Result<std::vector<ContainerInfo>> list();
    Result<std::string> status(int64_t ctid);
    Result<void> start(int64_t ctid);
    Result<void> stop(int64_t ctid);

    // File moves staged through a temporary file on the host
    Result<bool> file_exists(int64_t ctid, const std::string& path);
    Result<std::string> pull_file(int64_t ctid, const std::string& path, uint64_t max_bytes);
    Result<void> push_file(int64_t ctid, const std::string& path, const std::string& data,
                           unsigned mode);

    static std::string exec_command(int ctid, const std::string& command);
    static std::vector<ContainerInfo> parse_list(const std::string& pct_list_output);
    // "running", "stopped" or "unknown"
    static std::string parse_status(const std::string& pct_status_output);

private:
    SessionManager& session_;
    const SecurityGate& gate_;

    // Runs a pct command; non-zero exit becomes RemoteIo with its stderr
    Result<CommandResult> run_pct(const std::string& command, int ctid);
};
