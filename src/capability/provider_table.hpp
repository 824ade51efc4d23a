#pragma once

#include <set>
#include <string>
#include <vector>
#include <core/config.hpp>
#include "capability_registry.hpp"

namespace tools {

constexpr const char* SSH_EXEC_COMMAND = "ssh_exec_command";
constexpr const char* SSH_UPLOAD_FILE = "ssh_upload_file";
constexpr const char* SSH_DOWNLOAD_FILE = "ssh_download_file";

constexpr const char* CONTAINER_EXEC = "proxmox_container_exec_command";
constexpr const char* CONTAINER_LIST = "proxmox_list_containers";
constexpr const char* CONTAINER_STATUS = "proxmox_container_status";
constexpr const char* CONTAINER_START = "proxmox_start_container";
constexpr const char* CONTAINER_STOP = "proxmox_stop_container";
constexpr const char* CONTAINER_UPLOAD = "proxmox_upload_file_to_container";
constexpr const char* CONTAINER_DOWNLOAD = "proxmox_download_file_from_container";

constexpr const char* TRANSFER_REQUEST_UPLOAD = "transfer_request_upload";
constexpr const char* TRANSFER_CONFIRM_UPLOAD = "transfer_confirm_upload";
constexpr const char* TRANSFER_REQUEST_DOWNLOAD = "transfer_request_download";
constexpr const char* TRANSFER_CONFIRM_DOWNLOAD = "transfer_confirm_download";

} // namespace tools

constexpr const char* CONTAINERS_PROVIDER = "containers";
constexpr const char* BLOB_TRANSFER_PROVIDER = "blob_transfer";

std::set<std::string> core_tool_names();

// Every optional provider, enabled according to `flags`
std::vector<ProviderDescriptor> build_provider_table(const ProviderFlags& flags);
