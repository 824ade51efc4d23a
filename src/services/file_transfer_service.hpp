#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <security/security_gate.hpp>
#include <ssh/session_manager.hpp>

class ContainerService;

struct TransferReport {
    std::string source;
    std::string destination;
    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    std::optional<unsigned> permissions;
    std::optional<int> ctid;

    double bytes_per_second() const;
};

// Direct copies between the local filesystem and the managed host (SFTP),
// or a container on it when `ctid` is given.
class FileTransferService {
public:
    FileTransferService(SessionManager& session, const SecurityGate& gate,
                        ContainerService* containers = nullptr);

    Result<TransferReport> upload(const std::string& local_path, const std::string& remote_path,
                                  std::optional<int64_t> permissions = std::nullopt,
                                  bool overwrite = false,
                                  std::optional<int64_t> ctid = std::nullopt);
    Result<TransferReport> download(const std::string& remote_path, const std::string& local_path,
                                    bool overwrite = false,
                                    std::optional<int64_t> ctid = std::nullopt);

private:
    SessionManager& session_;
    const SecurityGate& gate_;
    ContainerService* containers_;

    Result<std::optional<int>> resolve_container(std::optional<int64_t> ctid) const;
    Result<std::string> read_local(const std::string& path) const;
    Result<void> write_local(const std::string& path, const std::string& data) const;
};
