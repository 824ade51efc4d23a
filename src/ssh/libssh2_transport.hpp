#pragma once

#include <string>
#include "transport.hpp"
#include <core/config.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// Non-blocking libssh2 session: exec channels for commands, one SFTP
// subsystem (opened on first file operation) for file I/O.
class Libssh2Transport : public Transport {
public:
    explicit Libssh2Transport(const HostConfig& config);
    ~Libssh2Transport() override;

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

    Result<void> connect(Deadline deadline) override;
    void close() override;
    bool is_connected() const override;
    bool check_alive() override;

    Result<CommandResult> exec(const std::string& command, Deadline deadline) override;

    Result<RemoteStat> stat(const std::string& path) override;
    Result<std::string> read_file(const std::string& path, uint64_t max_bytes) override;
    Result<void> write_file(const std::string& path, const std::string& data,
                            unsigned mode) override;
    Result<void> chmod(const std::string& path, unsigned mode) override;
    Result<void> rename(const std::string& from, const std::string& to) override;
    Result<void> remove(const std::string& path) override;

private:
    HostConfig config_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP* sftp_;
    socket_t sock_;
    bool active_;

    Result<void> verify_host_key();
    // stall_ms bounds the whole exchange
    Result<void> authenticate(int stall_ms);
    Result<void> ensure_sftp();

    // Block until the socket is ready in the direction libssh2 is waiting on.
    void wait_socket(int max_ms);
    std::string last_error() const;
    // Connection for transport-level failures, RemoteIo for SFTP status codes
    template <typename T>
    Result<T> sftp_failure(const std::string& what, const std::string& path);
    // Bounded close/free; false when the channel could not be released in time
    bool release_channel(LIBSSH2_CHANNEL* channel, int grace_ms);
};
