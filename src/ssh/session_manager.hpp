#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <security/security_gate.hpp>
#include "transport.hpp"

// Owns the single connection to the managed host. The connection is opened
// on first use and reopened after a failure; every command and file
// operation runs on it one at a time, callers served in arrival order.
class SessionManager {
public:
    SessionManager(TransportFactory factory, const SecurityGate& gate);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Runs `command` with `timeout_secs` (configured default when unset).
    // The timeout also bounds the wait for the session. A command that runs
    // out of time comes back with timed_out=true, not as an error.
    Result<CommandResult> exec(const std::string& command,
                               std::optional<int64_t> timeout_secs = std::nullopt);

    Result<RemoteStat> stat(const std::string& path);
    Result<bool> file_exists(const std::string& path);
    Result<std::string> read_file(const std::string& path, uint64_t max_bytes);

    // Writes a hidden sibling, sets `mode`, then renames it over `path`.
    // The destination never holds a partial file.
    Result<void> write_file_atomic(const std::string& path, const std::string& data,
                                   unsigned mode);
    Result<void> remove_file(const std::string& path);

    void close();
    bool is_connected() const;

private:
    TransportFactory factory_;
    const SecurityGate& gate_;
    std::unique_ptr<Transport> transport_;

    std::atomic<bool> connected_{false};

    // FIFO admission to the transport
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<uint64_t> waiting_;
    uint64_t next_ticket_ = 0;
    bool busy_ = false;

    // Exclusive use of the transport for one operation
    class Turn {
    public:
        Turn(SessionManager& owner, std::optional<Deadline> deadline);
        ~Turn();
        // False when the deadline passed before this caller's turn came
        bool held() const { return held_; }

    private:
        SessionManager& owner_;
        bool held_;
    };

    // Connects if needed; never waits past `deadline`
    Result<void> ensure_connected(Deadline deadline);
    void drop_transport(const std::string& reason);

    // Runs `op` on the transport (caller holds a Turn), reconnecting and
    // retrying once on a Connection failure. No retry starts after `deadline`.
    template <typename T>
    Result<T> run(const std::string& label, const std::function<Result<T>(Transport&)>& op,
                  Deadline deadline = Deadline::max());
};
