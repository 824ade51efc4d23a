#include "transfer_bridge.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <services/container_service.hpp>
#include <fmt/format.h>

namespace {

const char* NOT_FOUND_MESSAGE = "Transfer not found or expired";

} // namespace

const char* transfer_kind_name(TransferKind kind) {
    return kind == TransferKind::Upload ? "upload" : "download";
}

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::Awaiting:  return "AWAITING";
        case TransferState::Confirmed: return "CONFIRMED";
        case TransferState::Expired:   return "EXPIRED";
        case TransferState::Failed:    return "FAILED";
    }
    return "UNKNOWN";
}

TransferBridge::TransferBridge(SessionManager& session, BlobIntermediary& intermediary,
                               const SecurityGate& gate, TransferConfig config,
                               std::string key_prefix, ContainerService* containers,
                               ClockFn clock)
    : session_(session), intermediary_(intermediary), gate_(gate), config_(config),
      key_prefix_(std::move(key_prefix)), containers_(containers), clock_(std::move(clock)) {
    while (!key_prefix_.empty() && key_prefix_.back() == '/') key_prefix_.pop_back();
}

// ── Record bookkeeping ──────────────────────────────────────

void TransferBridge::sweep_expired() {
    std::vector<TransferRecord> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        for (auto it = records_.begin(); it != records_.end();) {
            if (!it->second.in_flight && now >= it->second.record.expires_at) {
                expired.push_back(it->second.record);
                it = records_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& rec : expired) {
        rexec_log(fmt::format("Transfer {} ({}) expired -> {}", rec.transfer_id,
                              transfer_kind_name(rec.kind),
                              transfer_state_name(TransferState::Expired)));
        discard_object(rec.object_key, "expired transfer");
    }
}

Result<TransferRecord> TransferBridge::claim(const std::string& transfer_id, TransferKind expected) {
    std::optional<TransferRecord> lapsed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(transfer_id);
        if (it == records_.end() || it->second.in_flight) {
            rexec_log(fmt::format("Transfer {}: no live record", transfer_id));
            return Result<TransferRecord>::Err(ErrorKind::TransferNotFound, NOT_FOUND_MESSAGE);
        }
        if (it->second.record.kind != expected) {
            return Result<TransferRecord>::Err(ErrorKind::InvalidArgument,
                fmt::format("Transfer {} is a {} transfer, not a {} transfer", transfer_id,
                            transfer_kind_name(it->second.record.kind),
                            transfer_kind_name(expected)));
        }
        if (clock_() >= it->second.record.expires_at) {
            lapsed = it->second.record;
            records_.erase(it);
        } else {
            it->second.in_flight = true;
            return Result<TransferRecord>::Ok(it->second.record);
        }
    }

    rexec_log(fmt::format("Transfer {}: expired before confirm", transfer_id));
    discard_object(lapsed->object_key, "expired transfer");
    return Result<TransferRecord>::Err(ErrorKind::TransferNotFound, NOT_FOUND_MESSAGE);
}

void TransferBridge::release(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(transfer_id);
    if (it != records_.end()) it->second.in_flight = false;
}

void TransferBridge::retire(const std::string& transfer_id, TransferState final_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(transfer_id);
    if (it == records_.end()) return;
    it->second.record.state = final_state;
    rexec_log(fmt::format("Transfer {} ({}) -> {}", transfer_id,
                          transfer_kind_name(it->second.record.kind),
                          transfer_state_name(final_state)));
    records_.erase(it);
}

void TransferBridge::discard_object(const std::string& key, const char* why) {
    auto removed = intermediary_.remove(key);
    if (removed.is_err()) {
        rexec_warn(fmt::format("Could not delete intermediary object {} ({}): {}",
                               key, why, removed.error));
    }
}

std::vector<TransferRecord> TransferBridge::active_transfers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferRecord> out;
    for (const auto& [id, entry] : records_) {
        if (!entry.in_flight) out.push_back(entry.record);
    }
    return out;
}

// ── Helpers ─────────────────────────────────────────────────

Result<std::optional<int>> TransferBridge::resolve_container(std::optional<int64_t> ctid) const {
    if (!ctid) return Result<std::optional<int>>::Ok(std::nullopt);
    if (!containers_) {
        return Result<std::optional<int>>::Err(ErrorKind::InvalidArgument,
            "ctid given but container support is not enabled");
    }
    auto id = SecurityGate::validate_container_id(*ctid);
    if (id.is_err()) return Result<std::optional<int>>::Err(id);
    return Result<std::optional<int>>::Ok(id.value);
}

Result<bool> TransferBridge::destination_exists(const std::string& path, std::optional<int> ctid) {
    if (ctid) return containers_->file_exists(*ctid, path);
    return session_.file_exists(path);
}

// ── Upload ──────────────────────────────────────────────────

Result<UploadTicket> TransferBridge::request_upload(const std::string& remote_path,
                                                    std::optional<int64_t> permissions,
                                                    bool overwrite,
                                                    std::optional<int64_t> ctid) {
    sweep_expired();

    auto risk = gate_.check_risk_accepted();
    if (risk.is_err()) return Result<UploadTicket>::Err(risk);
    auto path = gate_.validate_path(remote_path);
    if (path.is_err()) return Result<UploadTicket>::Err(path);

    std::optional<unsigned> mode;
    if (permissions) {
        auto perms = SecurityGate::validate_permissions(*permissions);
        if (perms.is_err()) return Result<UploadTicket>::Err(perms);
        mode = perms.value;
    }
    auto container = resolve_container(ctid);
    if (container.is_err()) return Result<UploadTicket>::Err(container);

    if (!overwrite) {
        auto exists = destination_exists(path.value, container.value);
        if (exists.is_err()) return Result<UploadTicket>::Err(exists);
        if (exists.value) {
            return Result<UploadTicket>::Err(ErrorKind::RemoteFileExists,
                fmt::format("File already exists: {}. Use overwrite=true to replace it", path.value));
        }
    }

    TransferRecord rec;
    rec.transfer_id = random_uuid();
    rec.kind = TransferKind::Upload;
    rec.remote_path = path.value;
    rec.object_key = fmt::format("{}/upload-{}", key_prefix_, rec.transfer_id);
    rec.created_at = clock_();
    rec.expires_at = rec.created_at + ttl();
    rec.permissions = mode;
    rec.overwrite = overwrite;
    rec.ctid = container.value;

    auto grant = intermediary_.grant_upload(rec.object_key, ttl());
    if (grant.is_err()) return Result<UploadTicket>::Err(grant);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[rec.transfer_id] = Entry{rec, false};
    }
    rexec_log(fmt::format("Transfer {} (upload) requested for {}", rec.transfer_id, rec.remote_path));

    UploadTicket ticket;
    ticket.transfer_id = rec.transfer_id;
    ticket.upload_command = grant.value.client_command;
    ticket.upload_target = grant.value.url;
    ticket.expires_in = config_.ttl_secs;
    ticket.remote_path = rec.remote_path;
    return Result<UploadTicket>::Ok(ticket);
}

Result<UploadReceipt> TransferBridge::confirm_upload(const std::string& transfer_id) {
    sweep_expired();

    auto claimed = claim(transfer_id, TransferKind::Upload);
    if (claimed.is_err()) return Result<UploadReceipt>::Err(claimed);
    const TransferRecord& rec = claimed.value;

    auto present = intermediary_.exists(rec.object_key);
    if (present.is_err() || !present.value) {
        release(transfer_id);
        if (present.is_err()) return Result<UploadReceipt>::Err(present);
        return Result<UploadReceipt>::Err(ErrorKind::Intermediary,
            "File has not been uploaded to the intermediary yet. Run the upload command first");
    }

    auto fail = [&](const auto& err) {
        retire(transfer_id, TransferState::Failed);
        discard_object(rec.object_key, "failed upload");
        return Result<UploadReceipt>::Err(err);
    };

    // The destination may have appeared since the request
    if (!rec.overwrite) {
        auto exists = destination_exists(rec.remote_path, rec.ctid);
        if (exists.is_err()) return fail(exists);
        if (exists.value) {
            return fail(Result<void>::Err(ErrorKind::RemoteFileExists,
                fmt::format("File already exists: {}", rec.remote_path)));
        }
    }

    auto data = intermediary_.fetch(rec.object_key,
                                    static_cast<uint64_t>(gate_.config().max_file_size));
    if (data.is_err()) return fail(data);

    unsigned mode = rec.permissions.value_or(DEFAULT_FILE_MODE);
    Result<void> written = rec.ctid
        ? containers_->push_file(*rec.ctid, rec.remote_path, data.value, mode)
        : session_.write_file_atomic(rec.remote_path, data.value, mode);
    if (written.is_err()) return fail(written);

    retire(transfer_id, TransferState::Confirmed);
    discard_object(rec.object_key, "confirmed upload");

    UploadReceipt receipt;
    receipt.success = true;
    receipt.remote_path = rec.remote_path;
    receipt.bytes_transferred = data.value.size();
    receipt.message = fmt::format("Uploaded {} to {}", format_bytes(receipt.bytes_transferred),
                                  rec.ctid ? fmt::format("container {}:{}", *rec.ctid, rec.remote_path)
                                           : rec.remote_path);
    return Result<UploadReceipt>::Ok(receipt);
}

// ── Download ────────────────────────────────────────────────

Result<DownloadTicket> TransferBridge::request_download(const std::string& remote_path,
                                                        std::optional<int64_t> ctid) {
    sweep_expired();

    auto risk = gate_.check_risk_accepted();
    if (risk.is_err()) return Result<DownloadTicket>::Err(risk);
    auto path = gate_.validate_path(remote_path);
    if (path.is_err()) return Result<DownloadTicket>::Err(path);
    auto container = resolve_container(ctid);
    if (container.is_err()) return Result<DownloadTicket>::Err(container);

    uint64_t max_bytes = static_cast<uint64_t>(gate_.config().max_file_size);
    Result<std::string> data{};
    if (container.value) {
        data = containers_->pull_file(*container.value, path.value, max_bytes);
    } else {
        auto st = session_.stat(path.value);
        if (st.is_err()) return Result<DownloadTicket>::Err(st);
        if (!st.value.exists) {
            return Result<DownloadTicket>::Err(ErrorKind::RemoteIo,
                                               "Remote file not found: " + path.value);
        }
        if (st.value.is_directory) {
            return Result<DownloadTicket>::Err(ErrorKind::InvalidArgument,
                                               "Remote path is a directory: " + path.value);
        }
        auto size_ok = gate_.check_file_size(st.value.size);
        if (size_ok.is_err()) return Result<DownloadTicket>::Err(size_ok);
        data = session_.read_file(path.value, max_bytes);
    }
    if (data.is_err()) return Result<DownloadTicket>::Err(data);

    TransferRecord rec;
    rec.transfer_id = random_uuid();
    rec.kind = TransferKind::Download;
    rec.remote_path = path.value;
    rec.object_key = fmt::format("{}/download-{}", key_prefix_, rec.transfer_id);
    rec.created_at = clock_();
    rec.expires_at = rec.created_at + ttl();
    rec.ctid = container.value;
    rec.size = data.value.size();

    auto published = intermediary_.publish(rec.object_key, data.value, ttl());
    if (published.is_err()) {
        discard_object(rec.object_key, "failed publish");
        return Result<DownloadTicket>::Err(published);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[rec.transfer_id] = Entry{rec, false};
    }
    rexec_log(fmt::format("Transfer {} (download) published {} ({} bytes)", rec.transfer_id,
                          rec.remote_path, rec.size));

    DownloadTicket ticket;
    ticket.transfer_id = rec.transfer_id;
    ticket.download_url = published.value.url;
    ticket.download_command = published.value.client_command;
    ticket.expires_in = config_.ttl_secs;
    ticket.remote_path = rec.remote_path;
    ticket.size = rec.size;
    return Result<DownloadTicket>::Ok(ticket);
}

Result<DownloadReceipt> TransferBridge::confirm_download(const std::string& transfer_id) {
    sweep_expired();

    auto claimed = claim(transfer_id, TransferKind::Download);
    if (claimed.is_err()) return Result<DownloadReceipt>::Err(claimed);

    discard_object(claimed.value.object_key, "confirmed download");
    retire(transfer_id, TransferState::Confirmed);

    DownloadReceipt receipt;
    receipt.success = true;
    receipt.remote_path = claimed.value.remote_path;
    receipt.message = "Download confirmed; intermediary copy deleted";
    return Result<DownloadReceipt>::Ok(receipt);
}
