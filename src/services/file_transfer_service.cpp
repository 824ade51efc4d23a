#include "file_transfer_service.hpp"
#include "container_service.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

double TransferReport::bytes_per_second() const {
    if (duration.count() <= 0) return 0.0;
    return static_cast<double>(bytes_transferred) * 1000.0 / static_cast<double>(duration.count());
}

FileTransferService::FileTransferService(SessionManager& session, const SecurityGate& gate,
                                         ContainerService* containers)
    : session_(session), gate_(gate), containers_(containers) {
}

Result<std::optional<int>> FileTransferService::resolve_container(std::optional<int64_t> ctid) const {
    if (!ctid) return Result<std::optional<int>>::Ok(std::nullopt);
    if (!containers_) {
        return Result<std::optional<int>>::Err(ErrorKind::InvalidArgument,
            "ctid given but container support is not enabled");
    }
    auto id = SecurityGate::validate_container_id(*ctid);
    if (id.is_err()) return Result<std::optional<int>>::Err(id);
    return Result<std::optional<int>>::Ok(id.value);
}

Result<std::string> FileTransferService::read_local(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<std::string>::Err(ErrorKind::LocalIo, "Local file not found: " + path);
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return Result<std::string>::Err(ErrorKind::LocalIo,
                                        fmt::format("Cannot stat {}: {}", path, ec.message()));
    }
    auto size_ok = gate_.check_file_size(size);
    if (size_ok.is_err()) return Result<std::string>::Err(size_ok);

    std::ifstream in(path, std::ios::binary);
    if (!in) return Result<std::string>::Err(ErrorKind::LocalIo, "Cannot open " + path);
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return Result<std::string>::Ok(std::move(data));
}

Result<void> FileTransferService::write_local(const std::string& path, const std::string& data) const {
    std::error_code ec;
    fs::path dest(path);
    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(ErrorKind::LocalIo,
                fmt::format("Cannot create {}: {}", dest.parent_path().string(), ec.message()));
        }
    }

    // Write beside the destination and rename into place
    fs::path tmp = dest;
    tmp += ".rexec-" + random_hex(4) + ".part";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out) {
            fs::remove(tmp, ec);
            return Result<void>::Err(ErrorKind::LocalIo, "Cannot write " + tmp.string());
        }
    }
    fs::rename(tmp, dest, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        return Result<void>::Err(ErrorKind::LocalIo,
                                 fmt::format("Cannot move download into {}: {}", path, reason));
    }
    return Result<void>::Ok();
}

Result<TransferReport> FileTransferService::upload(const std::string& local_path,
                                                   const std::string& remote_path,
                                                   std::optional<int64_t> permissions,
                                                   bool overwrite,
                                                   std::optional<int64_t> ctid) {
    auto risk = gate_.check_risk_accepted();
    if (risk.is_err()) return Result<TransferReport>::Err(risk);
    auto local = gate_.validate_path(local_path);
    if (local.is_err()) return Result<TransferReport>::Err(local);
    auto remote = gate_.validate_path(remote_path);
    if (remote.is_err()) return Result<TransferReport>::Err(remote);

    std::optional<unsigned> mode;
    if (permissions) {
        auto perms = SecurityGate::validate_permissions(*permissions);
        if (perms.is_err()) return Result<TransferReport>::Err(perms);
        mode = perms.value;
    }
    auto container = resolve_container(ctid);
    if (container.is_err()) return Result<TransferReport>::Err(container);

    auto data = read_local(local.value);
    if (data.is_err()) return Result<TransferReport>::Err(data);

    if (!overwrite) {
        auto exists = container.value ? containers_->file_exists(*container.value, remote.value)
                                      : session_.file_exists(remote.value);
        if (exists.is_err()) return Result<TransferReport>::Err(exists);
        if (exists.value) {
            return Result<TransferReport>::Err(ErrorKind::RemoteFileExists,
                fmt::format("Remote file already exists: {}. Use overwrite=true to replace it",
                            remote.value));
        }
    }

    auto start = std::chrono::steady_clock::now();
    unsigned effective = mode.value_or(DEFAULT_FILE_MODE);
    auto written = container.value
        ? containers_->push_file(*container.value, remote.value, data.value, effective)
        : session_.write_file_atomic(remote.value, data.value, effective);
    if (written.is_err()) return Result<TransferReport>::Err(written);

    TransferReport report;
    report.source = local.value;
    report.destination = remote.value;
    report.bytes_transferred = data.value.size();
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    report.permissions = mode;
    report.ctid = container.value;
    rexec_log(fmt::format("Uploaded {} -> {} ({})", report.source, report.destination,
                          format_bytes(report.bytes_transferred)));
    return Result<TransferReport>::Ok(report);
}

Result<TransferReport> FileTransferService::download(const std::string& remote_path,
                                                     const std::string& local_path,
                                                     bool overwrite,
                                                     std::optional<int64_t> ctid) {
    auto risk = gate_.check_risk_accepted();
    if (risk.is_err()) return Result<TransferReport>::Err(risk);
    auto remote = gate_.validate_path(remote_path);
    if (remote.is_err()) return Result<TransferReport>::Err(remote);
    auto local = gate_.validate_path(local_path);
    if (local.is_err()) return Result<TransferReport>::Err(local);
    auto container = resolve_container(ctid);
    if (container.is_err()) return Result<TransferReport>::Err(container);

    std::error_code ec;
    if (fs::exists(local.value, ec) && !overwrite) {
        return Result<TransferReport>::Err(ErrorKind::InvalidArgument,
            fmt::format("Local file already exists: {}. Use overwrite=true to replace it",
                        local.value));
    }

    uint64_t max_bytes = static_cast<uint64_t>(gate_.config().max_file_size);
    auto start = std::chrono::steady_clock::now();
    Result<std::string> data{};
    if (container.value) {
        data = containers_->pull_file(*container.value, remote.value, max_bytes);
    } else {
        auto st = session_.stat(remote.value);
        if (st.is_err()) return Result<TransferReport>::Err(st);
        if (!st.value.exists) {
            return Result<TransferReport>::Err(ErrorKind::RemoteIo,
                                               "Remote file not found: " + remote.value);
        }
        if (st.value.is_directory) {
            return Result<TransferReport>::Err(ErrorKind::InvalidArgument,
                                               "Remote path is a directory: " + remote.value);
        }
        auto size_ok = gate_.check_file_size(st.value.size);
        if (size_ok.is_err()) return Result<TransferReport>::Err(size_ok);
        data = session_.read_file(remote.value, max_bytes);
    }
    if (data.is_err()) return Result<TransferReport>::Err(data);

    auto written = write_local(local.value, data.value);
    if (written.is_err()) return Result<TransferReport>::Err(written);

    TransferReport report;
    report.source = remote.value;
    report.destination = local.value;
    report.bytes_transferred = data.value.size();
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    report.ctid = container.value;
    rexec_log(fmt::format("Downloaded {} -> {} ({})", report.source, report.destination,
                          format_bytes(report.bytes_transferred)));
    return Result<TransferReport>::Ok(report);
}
