#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <security/security_gate.hpp>
#include <ssh/session_manager.hpp>
#include "intermediary.hpp"

class ContainerService;

enum class TransferKind { Upload, Download };
enum class TransferState { Awaiting, Confirmed, Expired, Failed };

const char* transfer_kind_name(TransferKind kind);
const char* transfer_state_name(TransferState state);

struct TransferRecord {
    std::string transfer_id;
    TransferKind kind = TransferKind::Upload;
    std::string remote_path;
    std::string object_key;
    Clock::time_point created_at;
    Clock::time_point expires_at;
    std::optional<unsigned> permissions;
    bool overwrite = false;
    std::optional<int> ctid;
    TransferState state = TransferState::Awaiting;
    uint64_t size = 0;            // downloads only
};

struct UploadTicket {
    std::string transfer_id;
    std::string upload_command;
    std::string upload_target;
    int64_t expires_in = 0;
    std::string remote_path;
};

struct UploadReceipt {
    bool success = false;
    std::string message;
    std::string remote_path;
    uint64_t bytes_transferred = 0;
};

struct DownloadTicket {
    std::string transfer_id;
    std::string download_url;
    std::string download_command;
    int64_t expires_in = 0;
    std::string remote_path;
    uint64_t size = 0;
};

struct DownloadReceipt {
    bool success = false;
    std::string message;
    std::string remote_path;
};

// Two-phase transfers staged through a BlobIntermediary. A request creates a
// record and hands the caller short-lived access; the matching confirm moves
// the bytes and retires the record. Records live in memory only.
class TransferBridge {
public:
    TransferBridge(SessionManager& session, BlobIntermediary& intermediary,
                   const SecurityGate& gate, TransferConfig config, std::string key_prefix,
                   ContainerService* containers = nullptr, ClockFn clock = Clock::now);

    Result<UploadTicket> request_upload(const std::string& remote_path,
                                        std::optional<int64_t> permissions = std::nullopt,
                                        bool overwrite = false,
                                        std::optional<int64_t> ctid = std::nullopt);
    Result<UploadReceipt> confirm_upload(const std::string& transfer_id);

    Result<DownloadTicket> request_download(const std::string& remote_path,
                                            std::optional<int64_t> ctid = std::nullopt);
    Result<DownloadReceipt> confirm_download(const std::string& transfer_id);

    // Snapshot of live (AWAITING) records
    std::vector<TransferRecord> active_transfers() const;

private:
    struct Entry {
        TransferRecord record;
        bool in_flight = false;   // claimed by a confirm; invisible to others
    };

    SessionManager& session_;
    BlobIntermediary& intermediary_;
    const SecurityGate& gate_;
    TransferConfig config_;
    std::string key_prefix_;
    ContainerService* containers_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> records_;

    std::chrono::seconds ttl() const { return std::chrono::seconds(config_.ttl_secs); }

    // Evicts expired records and deletes their objects (best-effort)
    void sweep_expired();

    // Marks the record in-flight and returns a copy of it
    Result<TransferRecord> claim(const std::string& transfer_id, TransferKind expected);
    void release(const std::string& transfer_id);
    void retire(const std::string& transfer_id, TransferState final_state);

    void discard_object(const std::string& key, const char* why);

    Result<std::optional<int>> resolve_container(std::optional<int64_t> ctid) const;
    Result<bool> destination_exists(const std::string& path, std::optional<int> ctid);
};
