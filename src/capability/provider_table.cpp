#include "provider_table.hpp"

std::set<std::string> core_tool_names() {
    return {tools::SSH_EXEC_COMMAND, tools::SSH_UPLOAD_FILE, tools::SSH_DOWNLOAD_FILE};
}

std::vector<ProviderDescriptor> build_provider_table(const ProviderFlags& flags) {
    std::vector<ProviderDescriptor> table;

    ProviderDescriptor containers;
    containers.name = CONTAINERS_PROVIDER;
    containers.enabled = [on = flags.containers] { return on; };
    containers.contributes = {
        tools::CONTAINER_EXEC, tools::CONTAINER_LIST, tools::CONTAINER_STATUS,
        tools::CONTAINER_START, tools::CONTAINER_STOP,
        tools::CONTAINER_UPLOAD, tools::CONTAINER_DOWNLOAD,
    };
    table.push_back(containers);

    // Direct transfers need a path the caller can also see; the intermediary
    // replaces them when one is configured.
    ProviderDescriptor blob;
    blob.name = BLOB_TRANSFER_PROVIDER;
    blob.enabled = [on = flags.blob_transfer] { return on; };
    blob.contributes = {
        tools::TRANSFER_REQUEST_UPLOAD, tools::TRANSFER_CONFIRM_UPLOAD,
        tools::TRANSFER_REQUEST_DOWNLOAD, tools::TRANSFER_CONFIRM_DOWNLOAD,
    };
    blob.suppresses = {
        tools::SSH_UPLOAD_FILE, tools::SSH_DOWNLOAD_FILE,
        tools::CONTAINER_UPLOAD, tools::CONTAINER_DOWNLOAD,
    };
    table.push_back(blob);

    return table;
}
