#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <ssh/transport.hpp>
#include <transfer/intermediary.hpp>

// Scripted reply for one command
struct FakeReply {
    CommandResult result;
    std::chrono::milliseconds delay{0};
    // What the command had written when a deadline cut it off
    std::string partial_stdout;
    std::string partial_stderr;
};

inline FakeReply reply_ok(const std::string& out, int code = 0) {
    FakeReply r;
    r.result.stdout_data = out;
    r.result.exit_code = code;
    return r;
}

inline FakeReply reply_err(const std::string& err, int code) {
    FakeReply r;
    r.result.stderr_data = err;
    r.result.exit_code = code;
    return r;
}

struct FakeFile {
    std::string data;
    unsigned mode = 0644;
};

// Remote host state shared by every FakeTransport a factory hands out
struct FakeHost {
    std::mutex mutex;
    std::map<std::string, FakeFile> files;
    std::set<std::string> directories;

    std::function<FakeReply(const std::string&)> on_exec = [](const std::string&) {
        return reply_ok("");
    };
    std::vector<std::string> commands;

    int connect_failures = 0;        // next N connects fail with Connection
    std::chrono::milliseconds connect_stall{0};   // handshake delay on every connect
    int exec_link_failures = 0;      // next N execs drop the link
    int connects = 0;
    int active_execs = 0;
    int max_active_execs = 0;
    bool fail_rename = false;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeHost> host) : host_(std::move(host)) {}

    Result<void> connect(Deadline deadline) override {
        std::chrono::milliseconds stall;
        {
            std::lock_guard<std::mutex> lock(host_->mutex);
            host_->connects++;
            stall = host_->connect_stall;
        }
        auto finish = std::chrono::steady_clock::now() + stall;
        while (std::chrono::steady_clock::now() < finish) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return Result<void>::Err(ErrorKind::Connection, "SSH handshake timed out");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        std::lock_guard<std::mutex> lock(host_->mutex);
        if (host_->connect_failures > 0) {
            host_->connect_failures--;
            return Result<void>::Err(ErrorKind::Connection, "connection refused");
        }
        connected_ = true;
        return Result<void>::Ok();
    }

    void close() override { connected_ = false; }
    bool is_connected() const override { return connected_; }
    bool check_alive() override { return connected_; }

    Result<CommandResult> exec(const std::string& command, Deadline deadline) override {
        FakeReply reply;
        {
            std::lock_guard<std::mutex> lock(host_->mutex);
            host_->commands.push_back(command);
            if (host_->exec_link_failures > 0) {
                host_->exec_link_failures--;
                connected_ = false;
                return Result<CommandResult>::Err(ErrorKind::Connection, "link dropped");
            }
            host_->active_execs++;
            host_->max_active_execs = std::max(host_->max_active_execs, host_->active_execs);
            reply = host_->on_exec(command);
        }

        auto start = std::chrono::steady_clock::now();
        auto finish = start + reply.delay;
        bool timed_out = false;
        while (std::chrono::steady_clock::now() < finish) {
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        {
            std::lock_guard<std::mutex> lock(host_->mutex);
            host_->active_execs--;
        }

        CommandResult r = reply.result;
        if (timed_out) {
            r.stdout_data = reply.partial_stdout;
            r.stderr_data = reply.partial_stderr;
            r.exit_code.reset();
            r.timed_out = true;
        }
        r.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return Result<CommandResult>::Ok(r);
    }

    Result<RemoteStat> stat(const std::string& path) override {
        std::lock_guard<std::mutex> lock(host_->mutex);
        RemoteStat st;
        auto it = host_->files.find(path);
        if (it != host_->files.end()) {
            st.exists = true;
            st.is_regular = true;
            st.size = it->second.data.size();
            st.mode = it->second.mode;
        } else if (host_->directories.count(path)) {
            st.exists = true;
            st.is_directory = true;
        }
        return Result<RemoteStat>::Ok(st);
    }

    Result<std::string> read_file(const std::string& path, uint64_t max_bytes) override {
        std::lock_guard<std::mutex> lock(host_->mutex);
        auto it = host_->files.find(path);
        if (it == host_->files.end()) {
            return Result<std::string>::Err(ErrorKind::RemoteIo, "no such file: " + path);
        }
        if (it->second.data.size() > max_bytes) {
            return Result<std::string>::Err(ErrorKind::SizeLimitExceeded, "too large");
        }
        return Result<std::string>::Ok(it->second.data);
    }

    Result<void> write_file(const std::string& path, const std::string& data,
                            unsigned mode) override {
        std::lock_guard<std::mutex> lock(host_->mutex);
        host_->files[path] = FakeFile{data, mode};
        return Result<void>::Ok();
    }

    Result<void> chmod(const std::string& path, unsigned mode) override {
        std::lock_guard<std::mutex> lock(host_->mutex);
        auto it = host_->files.find(path);
        if (it == host_->files.end()) return Result<void>::Err(ErrorKind::RemoteIo, "no such file");
        it->second.mode = mode;
        return Result<void>::Ok();
    }

    Result<void> rename(const std::string& from, const std::string& to) override {
        std::lock_guard<std::mutex> lock(host_->mutex);
        if (host_->fail_rename) return Result<void>::Err(ErrorKind::RemoteIo, "rename refused");
        auto it = host_->files.find(from);
        if (it == host_->files.end()) return Result<void>::Err(ErrorKind::RemoteIo, "no such file");
        host_->files[to] = it->second;
        host_->files.erase(from);
        return Result<void>::Ok();
    }

    Result<void> remove(const std::string& path) override {
        std::lock_guard<std::mutex> lock(host_->mutex);
        host_->files.erase(path);
        return Result<void>::Ok();
    }

private:
    std::shared_ptr<FakeHost> host_;
    bool connected_ = false;
};

inline TransportFactory fake_factory(std::shared_ptr<FakeHost> host) {
    return [host] { return std::make_unique<FakeTransport>(host); };
}

// In-memory object store; upload grants are recorded, the "caller" pushes
// bytes with put().
class FakeIntermediary : public BlobIntermediary {
public:
    std::map<std::string, std::string> objects;
    std::vector<std::string> granted;
    std::vector<std::string> removed;
    bool fail_remove = false;
    bool fail_publish = false;

    void put(const std::string& key, const std::string& data) { objects[key] = data; }

    Result<UploadGrant> grant_upload(const std::string& key, std::chrono::seconds) override {
        granted.push_back(key);
        UploadGrant g;
        g.url = "https://blob.test/" + key + "?sig=put";
        g.client_command = "curl -X PUT --upload-file '<YOUR_FILE_PATH>' '" + g.url + "'";
        return Result<UploadGrant>::Ok(g);
    }

    Result<bool> exists(const std::string& key) override {
        return Result<bool>::Ok(objects.count(key) > 0);
    }

    Result<std::string> fetch(const std::string& key, uint64_t max_bytes) override {
        auto it = objects.find(key);
        if (it == objects.end()) return Result<std::string>::Err(ErrorKind::Intermediary, "missing");
        if (it->second.size() > max_bytes) {
            return Result<std::string>::Err(ErrorKind::SizeLimitExceeded, "object too large");
        }
        return Result<std::string>::Ok(it->second);
    }

    Result<PublishedObject> publish(const std::string& key, const std::string& data,
                                    std::chrono::seconds) override {
        if (fail_publish) return Result<PublishedObject>::Err(ErrorKind::Intermediary, "store down");
        objects[key] = data;
        PublishedObject p;
        p.url = "https://blob.test/" + key + "?sig=get";
        p.client_command = "curl -o '<YOUR_FILE_PATH>' '" + p.url + "'";
        return Result<PublishedObject>::Ok(p);
    }

    Result<void> remove(const std::string& key) override {
        removed.push_back(key);
        if (fail_remove) return Result<void>::Err(ErrorKind::Intermediary, "delete refused");
        objects.erase(key);
        return Result<void>::Ok();
    }
};

inline SecurityConfig permissive_security() {
    SecurityConfig s;
    s.risk_accepted = true;
    return s;
}

// Settable clock for expiry tests
struct ManualClock {
    std::shared_ptr<Clock::time_point> now =
        std::make_shared<Clock::time_point>(Clock::time_point(std::chrono::hours(24 * 365 * 50)));

    ClockFn fn() const {
        auto p = now;
        return [p] { return *p; };
    }
    void advance(std::chrono::seconds s) { *now += s; }
};
