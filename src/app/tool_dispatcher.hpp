#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <capability/capability_registry.hpp>
#include <core/config.hpp>
#include <core/types.hpp>

class SessionManager;
class FileTransferService;
class ContainerService;
class TransferBridge;

// Components a tool may delegate to. Null when the owning provider is off.
struct ToolServices {
    const Config* config = nullptr;
    SessionManager* session = nullptr;
    FileTransferService* files = nullptr;
    ContainerService* containers = nullptr;
    TransferBridge* transfers = nullptr;
};

struct ToolReply {
    bool success = false;
    nlohmann::json content;   // object, or a string for text renders
};

struct ToolSummary {
    std::string name;
    std::string owner;
    std::string description;
};

// Routes a tool call to its component and renders the outcome. Only tools
// in the exposed set are callable.
class ToolDispatcher {
public:
    ToolDispatcher(ExposedToolSet exposed, ToolServices services);

    ToolReply call(const std::string& tool, const nlohmann::json& arguments);

    // One line of `serve` input -> one line of output
    std::string handle_line(const std::string& line);

    static std::vector<ToolSummary> summaries(const ExposedToolSet& exposed);
    static std::string tool_description(const std::string& name);
    const ExposedToolSet& exposed() const { return exposed_; }

    static ToolReply failure(ErrorKind kind, const std::string& message,
                             const std::string& suggestion = "");

private:
    using Handler = std::function<ToolReply(const nlohmann::json&)>;

    ExposedToolSet exposed_;
    ToolServices services_;
    std::map<std::string, Handler> handlers_;

    void register_core();
    void register_containers();
    void register_transfers();

    ToolReply exec_command(const nlohmann::json& args);
    ToolReply upload_file(const nlohmann::json& args);
    ToolReply download_file(const nlohmann::json& args);

    ToolReply container_exec(const nlohmann::json& args);
    ToolReply container_list(const nlohmann::json& args);
    ToolReply container_status(const nlohmann::json& args);
    ToolReply container_power(const nlohmann::json& args, bool start);
    ToolReply container_upload(const nlohmann::json& args);
    ToolReply container_download(const nlohmann::json& args);

    ToolReply request_upload(const nlohmann::json& args);
    ToolReply confirm_upload(const nlohmann::json& args);
    ToolReply request_download(const nlohmann::json& args);
    ToolReply confirm_download(const nlohmann::json& args);
};

// Serialize without throwing on invalid UTF-8 in remote output
std::string dump_json(const nlohmann::json& j, int indent = -1);
