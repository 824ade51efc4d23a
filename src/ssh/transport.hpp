#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

using Deadline = std::chrono::steady_clock::time_point;

// One authenticated connection to the managed host. Implementations are not
// thread-safe; SessionManager serializes every call.
//
// Error contract: ErrorKind::Connection means the link is unusable and the
// caller may reconnect. A command that outlives its deadline is reported as
// CommandResult::timed_out, not as an error.
class Transport {
public:
    virtual ~Transport() = default;

    // Gives up with ErrorKind::Connection once `deadline` passes, whatever
    // the configured connect timeout
    virtual Result<void> connect(Deadline deadline) = 0;
    virtual void close() = 0;
    virtual bool is_connected() const = 0;

    // Keepalive probe. False marks the connection dead.
    virtual bool check_alive() = 0;

    virtual Result<CommandResult> exec(const std::string& command, Deadline deadline) = 0;

    // exists=false (not an error) when the path is absent
    virtual Result<RemoteStat> stat(const std::string& path) = 0;
    virtual Result<std::string> read_file(const std::string& path, uint64_t max_bytes) = 0;
    virtual Result<void> write_file(const std::string& path, const std::string& data,
                                    unsigned mode) = 0;
    virtual Result<void> chmod(const std::string& path, unsigned mode) = 0;
    // Replaces `to` if it exists
    virtual Result<void> rename(const std::string& from, const std::string& to) = 0;
    // Absent files are not an error
    virtual Result<void> remove(const std::string& path) = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;
