#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <algorithm>
#include <chrono>
#include <mutex>

using std::chrono::steady_clock;
using std::chrono::milliseconds;

namespace {

void ensure_libssh2_init() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

int ms_until(steady_clock::time_point t) {
    auto left = std::chrono::duration_cast<milliseconds>(t - steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void wait_on(LIBSSH2_SESSION* session, socket_t sock, int max_ms) {
    int dir = libssh2_session_block_directions(session);
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) {
        platform::sleep_ms(std::min(max_ms, SSH_POLL_INTERVAL_MS));
        return;
    }
    platform::poll_socket(sock, events, max_ms);
}

// Retry a libssh2 call while it reports EAGAIN. Gives LIBSSH2_ERROR_TIMEOUT
// when the call makes no progress within stall_ms.
template <typename Fn>
auto until_done(LIBSSH2_SESSION* session, socket_t sock, int stall_ms, Fn fn) -> decltype(fn()) {
    auto limit = steady_clock::now() + milliseconds(stall_ms);
    decltype(fn()) rc;
    while ((rc = fn()) == LIBSSH2_ERROR_EAGAIN) {
        if (steady_clock::now() >= limit) return LIBSSH2_ERROR_TIMEOUT;
        wait_on(session, sock, std::min(100, ms_until(limit)));
    }
    return rc;
}

// Same for the calls that return a handle and report EAGAIN via last_errno.
template <typename Fn>
auto until_handle(LIBSSH2_SESSION* session, socket_t sock, int stall_ms, Fn fn) -> decltype(fn()) {
    auto limit = steady_clock::now() + milliseconds(stall_ms);
    decltype(fn()) handle;
    while (!(handle = fn())) {
        if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) return nullptr;
        if (steady_clock::now() >= limit) return nullptr;
        wait_on(session, sock, std::min(100, ms_until(limit)));
    }
    return handle;
}

int knownhost_key_type(int hostkey_type) {
    switch (hostkey_type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
        default:                             return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

std::string sha256_fingerprint(LIBSSH2_SESSION* session) {
    const auto* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (!h) return "unavailable";
    std::string fp = "SHA256:";
    for (int i = 0; i < 32; ++i) {
        if (i) fp += ':';
        fp += fmt::format("{:02X}", h[i]);
    }
    return fp;
}

} // namespace

Libssh2Transport::Libssh2Transport(const HostConfig& config)
    : config_(config), session_(nullptr), sftp_(nullptr),
      sock_(REXEC_INVALID_SOCKET), active_(false) {
}

Libssh2Transport::~Libssh2Transport() {
    close();
}

std::string Libssh2Transport::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown libssh2 error";
    return std::string(msg, static_cast<size_t>(len));
}

void Libssh2Transport::wait_socket(int max_ms) {
    wait_on(session_, sock_, max_ms);
}

Result<void> Libssh2Transport::connect(Deadline deadline) {
    close();
    ensure_libssh2_init();

    std::string target = fmt::format("{}@{}:{}", config_.username, config_.host, config_.port);
    rexec_log("Connecting to " + target);

    // Every phase below shares one budget: connect_timeout, cut short by the
    // caller's deadline
    auto limit = std::min(deadline,
                          steady_clock::now() + std::chrono::seconds(config_.connect_timeout));
    auto budget_ms = [&] { return std::max(1, ms_until(limit)); };

    auto sock = platform::connect_tcp(config_.host, config_.port, budget_ms());
    if (sock.is_err()) return Result<void>::Err(sock);
    sock_ = sock.value;
    platform::enable_keepalive(sock_);

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err(ErrorKind::Connection, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int rc = until_done(session_, sock_, budget_ms(),
                        [&] { return libssh2_session_handshake(session_, sock_); });
    if (rc != 0) {
        std::string err = last_error();
        close();
        return Result<void>::Err(ErrorKind::Connection, "SSH handshake failed: " + err);
    }

    auto hk = verify_host_key();
    if (hk.is_err()) {
        close();
        return hk;
    }

    if (steady_clock::now() >= limit) {
        close();
        return Result<void>::Err(ErrorKind::Connection, "Timed out before authentication");
    }
    auto auth = authenticate(budget_ms());
    if (auth.is_err()) {
        close();
        return auth;
    }

    // SSH keepalive every 30s
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_INTERVAL_SECS);

    active_ = true;
    rexec_log("Connected to " + target);
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::verify_host_key() {
    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        return Result<void>::Err(ErrorKind::HostKey, "Server did not present a host key");
    }
    std::string fingerprint = sha256_fingerprint(session_);

    std::string kh_path = config_.known_hosts_path;
    if (kh_path.empty()) kh_path = (platform::home_dir() / ".ssh" / "known_hosts").string();

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        return Result<void>::Err(ErrorKind::HostKey, "Failed to initialize known_hosts");
    }

    bool loaded = libssh2_knownhost_readfile(nh, kh_path.c_str(),
                                             LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;

    int check = LIBSSH2_KNOWNHOST_CHECK_NOTFOUND;
    if (loaded) {
        int alg = knownhost_key_type(keytype);
        struct libssh2_knownhost* found = nullptr;
        check = libssh2_knownhost_checkp(nh, config_.host.c_str(), config_.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                         LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &found);
    }
    libssh2_knownhost_free(nh);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) return Result<void>::Ok();

    if (config_.host_key_mode == HostKeyMode::Trusting) {
        rexec_warn(fmt::format("Accepting unverified host key for {} ({})",
                               config_.host, fingerprint));
        return Result<void>::Ok();
    }

    if (!loaded) {
        return Result<void>::Err(ErrorKind::HostKey,
            fmt::format("known_hosts file {} is missing or unreadable (strict host key checking)",
                        kh_path));
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        return Result<void>::Err(ErrorKind::HostKey,
            fmt::format("Host key for {} does not match known_hosts ({})",
                        config_.host, fingerprint));
    }
    return Result<void>::Err(ErrorKind::HostKey,
        fmt::format("Host {} is not in {} ({}). Add it with ssh-keyscan or set "
                    "SSH_STRICT_HOST_KEY_CHECKING=false", config_.host, kh_path, fingerprint));
}

Result<void> Libssh2Transport::authenticate(int stall_ms) {
    const char* passphrase = config_.key_passphrase ? config_.key_passphrase->c_str() : nullptr;
    const auto& user = config_.username;
    int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;

    if (config_.key_data) {
        const auto& key = *config_.key_data;
        rc = until_done(session_, sock_, stall_ms, [&] {
            return libssh2_userauth_publickey_frommemory(
                session_, user.c_str(), user.size(), nullptr, 0,
                key.c_str(), key.size(), passphrase);
        });
    } else if (config_.key_path) {
        const auto& key = *config_.key_path;
        rc = until_done(session_, sock_, stall_ms, [&] {
            return libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                       key.c_str(), passphrase);
        });
    }

    if (rc != 0 && config_.password) {
        const auto& pw = *config_.password;
        rc = until_done(session_, sock_, stall_ms, [&] {
            return libssh2_userauth_password(session_, user.c_str(), pw.c_str());
        });
    }

    if (rc == 0) return Result<void>::Ok();

    if (rc == LIBSSH2_ERROR_TIMEOUT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
        rc == LIBSSH2_ERROR_SOCKET_RECV || rc == LIBSSH2_ERROR_SOCKET_DISCONNECT) {
        return Result<void>::Err(ErrorKind::Connection,
                                 "Connection lost during authentication: " + last_error());
    }
    if (rc == LIBSSH2_ERROR_FILE) {
        return Result<void>::Err(ErrorKind::Authentication,
            "Unable to read or parse private key (wrong passphrase or unsupported format): " +
            last_error());
    }
    return Result<void>::Err(ErrorKind::Authentication,
        fmt::format("Authentication failed for {}@{}: {}", user, config_.host, last_error()));
}

void Libssh2Transport::close() {
    active_ = false;

    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != REXEC_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = REXEC_INVALID_SOCKET;
    }
}

bool Libssh2Transport::is_connected() const {
    return active_ && session_ != nullptr;
}

bool Libssh2Transport::check_alive() {
    if (!active_ || !session_ || sock_ == REXEC_INVALID_SOCKET) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}

bool Libssh2Transport::release_channel(LIBSSH2_CHANNEL* channel, int grace_ms) {
    int rc = until_done(session_, sock_, grace_ms,
                        [&] { return libssh2_channel_close(channel); });
    if (rc == 0) {
        until_done(session_, sock_, grace_ms,
                   [&] { return libssh2_channel_wait_closed(channel); });
    }
    rc = until_done(session_, sock_, grace_ms, [&] { return libssh2_channel_free(channel); });
    return rc == 0;
}

Result<CommandResult> Libssh2Transport::exec(const std::string& command, Deadline deadline) {
    auto started = steady_clock::now();
    CommandResult out;
    auto finish_timed_out = [&](LIBSSH2_CHANNEL* channel) {
        if (channel) {
#if LIBSSH2_VERSION_NUM >= 0x010b00
            libssh2_channel_signal_ex(channel, "KILL", 4);
#endif
            // A channel that will not close cleanly poisons the session
            if (!release_channel(channel, SSH_CLOSE_GRACE_MS)) close();
        }
        out.timed_out = true;
        out.exit_code.reset();
        out.duration = std::chrono::duration_cast<milliseconds>(steady_clock::now() - started);
        return Result<CommandResult>::Ok(out);
    };

    if (!is_connected()) {
        return Result<CommandResult>::Err(ErrorKind::Connection, "Not connected");
    }

    // Open a new exec channel (no PTY, binary-clean)
    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            active_ = false;
            return Result<CommandResult>::Err(ErrorKind::Connection,
                                              "Failed to open exec channel: " + last_error());
        }
        if (steady_clock::now() >= deadline) return finish_timed_out(nullptr);
        wait_socket(std::min(100, ms_until(deadline)));
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (steady_clock::now() >= deadline) return finish_timed_out(channel);
        wait_socket(std::min(100, ms_until(deadline)));
    }
    if (rc != 0) {
        std::string err = last_error();
        release_channel(channel, SSH_CLOSE_GRACE_MS);
        return Result<CommandResult>::Err(ErrorKind::Connection,
                                          "Failed to exec command on channel: " + err);
    }

    // Read stdout and stderr until EOF
    char buf[SSH_READ_BUF_SIZE];
    for (;;) {
        bool progressed = false;

        ssize_t n = libssh2_channel_read(channel, buf, sizeof(buf));
        if (n > 0) {
            out.stdout_data.append(buf, static_cast<size_t>(n));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            std::string err = last_error();
            release_channel(channel, SSH_CLOSE_GRACE_MS);
            active_ = false;
            return Result<CommandResult>::Err(ErrorKind::Connection,
                                              "SSH channel read error: " + err);
        }

        ssize_t e = libssh2_channel_read_stderr(channel, buf, sizeof(buf));
        if (e > 0) {
            out.stderr_data.append(buf, static_cast<size_t>(e));
            progressed = true;
        } else if (e < 0 && e != LIBSSH2_ERROR_EAGAIN) {
            std::string err = last_error();
            release_channel(channel, SSH_CLOSE_GRACE_MS);
            active_ = false;
            return Result<CommandResult>::Err(ErrorKind::Connection,
                                              "SSH channel read error: " + err);
        }

        if (progressed) continue;
        if (libssh2_channel_eof(channel)) break;
        if (steady_clock::now() >= deadline) return finish_timed_out(channel);
        wait_socket(std::min(100, ms_until(deadline)));
    }

    int close_rc = until_done(session_, sock_, SSH_CLOSE_GRACE_MS,
                              [&] { return libssh2_channel_close(channel); });
    if (close_rc == 0) {
        until_done(session_, sock_, SSH_CLOSE_GRACE_MS,
                   [&] { return libssh2_channel_wait_closed(channel); });
    }
    out.exit_code = libssh2_channel_get_exit_status(channel);

    char* exit_signal = nullptr;
    libssh2_channel_get_exit_signal(channel, &exit_signal, nullptr, nullptr, nullptr,
                                    nullptr, nullptr);
    if (exit_signal) {
        rexec_debug(fmt::format("Remote command terminated by signal {}", exit_signal));
        libssh2_free(session_, exit_signal);
    }

    if (until_done(session_, sock_, SSH_CLOSE_GRACE_MS,
                   [&] { return libssh2_channel_free(channel); }) != 0) {
        close();
    }

    out.duration = std::chrono::duration_cast<milliseconds>(steady_clock::now() - started);
    return Result<CommandResult>::Ok(out);
}

// ── SFTP ────────────────────────────────────────────────────

Result<void> Libssh2Transport::ensure_sftp() {
    if (!is_connected()) {
        return Result<void>::Err(ErrorKind::Connection, "Not connected");
    }
    if (sftp_) return Result<void>::Ok();

    sftp_ = until_handle(session_, sock_, config_.connect_timeout * 1000,
                         [&] { return libssh2_sftp_init(session_); });
    if (!sftp_) {
        active_ = false;
        return Result<void>::Err(ErrorKind::Connection,
                                 "Failed to start SFTP subsystem: " + last_error());
    }
    return Result<void>::Ok();
}

template <typename T>
Result<T> Libssh2Transport::sftp_failure(const std::string& what, const std::string& path) {
    int err = libssh2_session_last_errno(session_);
    if (err == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        std::string reason;
        switch (code) {
            case LIBSSH2_FX_NO_SUCH_FILE:     reason = "no such file or directory"; break;
            case LIBSSH2_FX_PERMISSION_DENIED: reason = "permission denied"; break;
            case LIBSSH2_FX_FAILURE:          reason = "operation failed"; break;
            case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: reason = "no space left on device"; break;
            case LIBSSH2_FX_QUOTA_EXCEEDED:   reason = "quota exceeded"; break;
            default: reason = fmt::format("SFTP status {}", code); break;
        }
        return Result<T>::Err(ErrorKind::RemoteIo, fmt::format("{} {}: {}", what, path, reason));
    }
    active_ = false;
    return Result<T>::Err(ErrorKind::Connection,
                          fmt::format("{} {}: {}", what, path, last_error()));
}

Result<RemoteStat> Libssh2Transport::stat(const std::string& path) {
    auto ready = ensure_sftp();
    if (ready.is_err()) return Result<RemoteStat>::Err(ready);

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int rc = until_done(session_, sock_, config_.connect_timeout * 1000, [&] {
        return libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_SFTP_STAT, &attrs);
    });

    RemoteStat st;
    if (rc != 0) {
        if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_NO_SUCH_FILE) {
            return Result<RemoteStat>::Ok(st);
        }
        return sftp_failure<RemoteStat>("Cannot stat", path);
    }

    st.exists = true;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) st.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        st.mode = static_cast<unsigned>(attrs.permissions & 07777);
        st.is_regular = LIBSSH2_SFTP_S_ISREG(attrs.permissions);
        st.is_directory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    }
    return Result<RemoteStat>::Ok(st);
}

Result<std::string> Libssh2Transport::read_file(const std::string& path, uint64_t max_bytes) {
    auto ready = ensure_sftp();
    if (ready.is_err()) return Result<std::string>::Err(ready);
    const int stall_ms = config_.connect_timeout * 1000;

    LIBSSH2_SFTP_HANDLE* handle = until_handle(session_, sock_, stall_ms, [&] {
        return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    });
    if (!handle) return sftp_failure<std::string>("Cannot open", path);

    std::string data;
    char buf[SSH_READ_BUF_SIZE];
    for (;;) {
        ssize_t n = until_done(session_, sock_, stall_ms,
                               [&] { return libssh2_sftp_read(handle, buf, sizeof(buf)); });
        if (n == 0) break;
        if (n < 0) {
            auto failure = sftp_failure<std::string>("Read failed for", path);
            libssh2_sftp_close_handle(handle);
            return failure;
        }
        data.append(buf, static_cast<size_t>(n));
        if (data.size() > max_bytes) {
            until_done(session_, sock_, stall_ms, [&] { return libssh2_sftp_close_handle(handle); });
            return Result<std::string>::Err(ErrorKind::SizeLimitExceeded,
                fmt::format("File {} exceeds the {} limit", path, format_bytes(max_bytes)));
        }
    }

    until_done(session_, sock_, stall_ms, [&] { return libssh2_sftp_close_handle(handle); });
    return Result<std::string>::Ok(std::move(data));
}

Result<void> Libssh2Transport::write_file(const std::string& path, const std::string& data,
                                          unsigned mode) {
    auto ready = ensure_sftp();
    if (ready.is_err()) return ready;
    const int stall_ms = config_.connect_timeout * 1000;

    LIBSSH2_SFTP_HANDLE* handle = until_handle(session_, sock_, stall_ms, [&] {
        return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                    static_cast<long>(mode), LIBSSH2_SFTP_OPENFILE);
    });
    if (!handle) return sftp_failure<void>("Cannot create", path);

    size_t sent = 0;
    while (sent < data.size()) {
        size_t chunk = std::min(data.size() - sent, static_cast<size_t>(SSH_READ_BUF_SIZE));
        ssize_t w = until_done(session_, sock_, stall_ms, [&] {
            return libssh2_sftp_write(handle, data.data() + sent, chunk);
        });
        if (w < 0) {
            auto failure = sftp_failure<void>("Write failed for", path);
            libssh2_sftp_close_handle(handle);
            return failure;
        }
        sent += static_cast<size_t>(w);
    }

    int rc = until_done(session_, sock_, stall_ms,
                        [&] { return libssh2_sftp_close_handle(handle); });
    if (rc != 0) return sftp_failure<void>("Close failed for", path);
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::chmod(const std::string& path, unsigned mode) {
    auto ready = ensure_sftp();
    if (ready.is_err()) return ready;

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    attrs.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    attrs.permissions = mode;
    int rc = until_done(session_, sock_, config_.connect_timeout * 1000, [&] {
        return libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_SFTP_SETSTAT, &attrs);
    });
    if (rc != 0) return sftp_failure<void>("Cannot chmod", path);
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::rename(const std::string& from, const std::string& to) {
    auto ready = ensure_sftp();
    if (ready.is_err()) return ready;

    int rc = until_done(session_, sock_, config_.connect_timeout * 1000, [&] {
        return libssh2_sftp_rename_ex(sftp_, from.c_str(), static_cast<unsigned>(from.size()),
                                      to.c_str(), static_cast<unsigned>(to.size()),
                                      LIBSSH2_SFTP_RENAME_OVERWRITE |
                                      LIBSSH2_SFTP_RENAME_ATOMIC |
                                      LIBSSH2_SFTP_RENAME_NATIVE);
    });
    if (rc == 0) return Result<void>::Ok();
    if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_SFTP_PROTOCOL) {
        return sftp_failure<void>("Cannot rename", from);
    }

    // SFTPv3 servers refuse to rename over an existing file; mv(1) does
    auto deadline = steady_clock::now() + std::chrono::seconds(CONTAINER_OP_TIMEOUT_SECS);
    auto mv = exec(fmt::format("mv -f -- {} {}", shell_quote(from), shell_quote(to)), deadline);
    if (mv.is_err()) return Result<void>::Err(mv);
    if (!mv.value.succeeded()) {
        return Result<void>::Err(ErrorKind::RemoteIo,
            fmt::format("Cannot rename {} to {}: {}", from, to, mv.value.stderr_data));
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::remove(const std::string& path) {
    auto ready = ensure_sftp();
    if (ready.is_err()) return ready;

    int rc = until_done(session_, sock_, config_.connect_timeout * 1000, [&] {
        return libssh2_sftp_unlink_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()));
    });
    if (rc == 0) return Result<void>::Ok();
    if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL &&
        libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_NO_SUCH_FILE) {
        return Result<void>::Ok();
    }
    return sftp_failure<void>("Cannot remove", path);
}
