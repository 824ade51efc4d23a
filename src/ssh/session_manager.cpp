#include "session_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

using std::chrono::steady_clock;

// ── Turn ────────────────────────────────────────────────────

SessionManager::Turn::Turn(SessionManager& owner, std::optional<Deadline> deadline)
    : owner_(owner), held_(false) {
    std::unique_lock<std::mutex> lock(owner_.queue_mutex_);
    uint64_t ticket = owner_.next_ticket_++;
    owner_.waiting_.push_back(ticket);

    auto my_turn = [&] { return !owner_.busy_ && owner_.waiting_.front() == ticket; };
    bool ready = deadline ? owner_.queue_cv_.wait_until(lock, *deadline, my_turn)
                          : (owner_.queue_cv_.wait(lock, my_turn), true);

    if (!ready) {
        // Give up our place; the caller behind us may now be at the front
        owner_.waiting_.erase(std::find(owner_.waiting_.begin(), owner_.waiting_.end(), ticket));
        owner_.queue_cv_.notify_all();
        return;
    }
    owner_.waiting_.pop_front();
    owner_.busy_ = true;
    held_ = true;
}

SessionManager::Turn::~Turn() {
    if (!held_) return;
    {
        std::lock_guard<std::mutex> lock(owner_.queue_mutex_);
        owner_.busy_ = false;
    }
    owner_.queue_cv_.notify_all();
}

// ── SessionManager ──────────────────────────────────────────

SessionManager::SessionManager(TransportFactory factory, const SecurityGate& gate)
    : factory_(std::move(factory)), gate_(gate) {
}

SessionManager::~SessionManager() {
    close();
}

void SessionManager::close() {
    Turn turn(*this, std::nullopt);
    if (transport_) {
        transport_->close();
        transport_.reset();
        rexec_log("Session closed");
    }
    connected_ = false;
}

bool SessionManager::is_connected() const {
    return connected_;
}

void SessionManager::drop_transport(const std::string& reason) {
    rexec_warn("Dropping session: " + reason);
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
    connected_ = false;
}

Result<void> SessionManager::ensure_connected(Deadline deadline) {
    if (transport_ && transport_->is_connected()) {
        if (transport_->check_alive()) return Result<void>::Ok();
        drop_transport("keepalive failed");
    }
    if (steady_clock::now() >= deadline) {
        return Result<void>::Err(ErrorKind::Connection, "Timed out before the session was ready");
    }

    if (!transport_) transport_ = factory_();
    if (!transport_) {
        return Result<void>::Err(ErrorKind::Connection, "No transport available");
    }

    auto r = transport_->connect(deadline);
    if (r.is_err()) {
        rexec_error(fmt::format("Connect failed ({}): {}", error_kind_name(r.kind), r.error));
        transport_->close();
        transport_.reset();
        connected_ = false;
        return r;
    }
    connected_ = true;
    return Result<void>::Ok();
}

template <typename T>
Result<T> SessionManager::run(const std::string& label,
                              const std::function<Result<T>(Transport&)>& op,
                              Deadline deadline) {
    for (int attempt = 0;; ++attempt) {
        auto conn = ensure_connected(deadline);
        if (conn.is_err()) {
            if (conn.kind != ErrorKind::Connection || attempt >= SESSION_MAX_RECONNECTS ||
                steady_clock::now() >= deadline) {
                return Result<T>::Err(conn);
            }
        } else {
            auto result = op(*transport_);
            if (result.is_ok() || result.kind != ErrorKind::Connection) return result;
            drop_transport(label + ": " + result.error);
            if (attempt >= SESSION_MAX_RECONNECTS || steady_clock::now() >= deadline) return result;
        }
        rexec_warn(fmt::format("{}: connection failure, reconnecting and retrying", label));
    }
}

Result<CommandResult> SessionManager::exec(const std::string& command,
                                           std::optional<int64_t> timeout_secs) {
    auto risk = gate_.check_risk_accepted();
    if (risk.is_err()) return Result<CommandResult>::Err(risk);
    auto valid = gate_.validate_command(command);
    if (valid.is_err()) return Result<CommandResult>::Err(valid);
    auto timeout = gate_.validate_timeout(timeout_secs);
    if (timeout.is_err()) return Result<CommandResult>::Err(timeout);

    auto started = steady_clock::now();
    Deadline deadline = started + std::chrono::seconds(timeout.value);
    auto timed_out = [&] {
        CommandResult r;
        r.timed_out = true;
        r.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            steady_clock::now() - started);
        return Result<CommandResult>::Ok(r);
    };

    Turn turn(*this, deadline);
    if (!turn.held()) {
        rexec_warn(fmt::format("exec: timed out after {}s waiting for the session", timeout.value));
        return timed_out();
    }

    auto result = run<CommandResult>("exec", [&](Transport& t) -> Result<CommandResult> {
        if (steady_clock::now() >= deadline) return timed_out();
        return t.exec(command, deadline);
    }, deadline);
    if (result.is_ok()) rexec_log_exec("exec", command, result.value);
    return result;
}

Result<RemoteStat> SessionManager::stat(const std::string& path) {
    Turn turn(*this, std::nullopt);
    return run<RemoteStat>("stat", [&](Transport& t) { return t.stat(path); });
}

Result<bool> SessionManager::file_exists(const std::string& path) {
    auto st = stat(path);
    if (st.is_err()) return Result<bool>::Err(st);
    return Result<bool>::Ok(st.value.exists);
}

Result<std::string> SessionManager::read_file(const std::string& path, uint64_t max_bytes) {
    Turn turn(*this, std::nullopt);
    return run<std::string>("read", [&](Transport& t) { return t.read_file(path, max_bytes); });
}

Result<void> SessionManager::write_file_atomic(const std::string& path, const std::string& data,
                                               unsigned mode) {
    auto risk = gate_.check_risk_accepted();
    if (risk.is_err()) return risk;

    auto slash = path.rfind('/');
    std::string dir = (slash == std::string::npos) ? "" : path.substr(0, slash + 1);
    std::string base = (slash == std::string::npos) ? path : path.substr(slash + 1);
    std::string tmp = fmt::format("{}.{}.rexec-{}.tmp", dir, base, random_hex(4));

    Turn turn(*this, std::nullopt);
    return run<void>("write", [&](Transport& t) -> Result<void> {
        auto discard_tmp = [&](const Result<void>& failure) {
            if (t.is_connected()) {
                auto rm = t.remove(tmp);
                if (rm.is_err()) rexec_warn("Could not remove temporary file " + tmp + ": " + rm.error);
            }
            return failure;
        };

        auto written = t.write_file(tmp, data, mode);
        if (written.is_err()) return discard_tmp(written);
        auto moded = t.chmod(tmp, mode);
        if (moded.is_err()) return discard_tmp(moded);
        auto renamed = t.rename(tmp, path);
        if (renamed.is_err()) return discard_tmp(renamed);

        rexec_log(fmt::format("Wrote {} ({} bytes, mode {:04o})", path, data.size(), mode));
        return Result<void>::Ok();
    });
}

Result<void> SessionManager::remove_file(const std::string& path) {
    auto risk = gate_.check_risk_accepted();
    if (risk.is_err()) return risk;

    Turn turn(*this, std::nullopt);
    return run<void>("remove", [&](Transport& t) { return t.remove(path); });
}
