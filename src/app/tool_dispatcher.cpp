#include "tool_dispatcher.hpp"
#include <capability/provider_table.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <output/output_formatter.hpp>
#include <services/container_service.hpp>
#include <services/file_transfer_service.hpp>
#include <ssh/session_manager.hpp>
#include <transfer/transfer_bridge.hpp>
#include <fmt/format.h>
#include <filesystem>

using nlohmann::json;

namespace {

const char* LIST_CONTAINERS_HINT = "Use proxmox_list_containers to see available containers";
const char* ENABLE_CONTAINERS_HINT =
    "Container targets need the containers provider (providers.containers or ENABLE_PROXMOX=true)";
const char* NEW_TRANSFER_HINT =
    "Transfer ids are single-use and expire; request a new transfer";

// Reads tool arguments, keeping the first problem it meets
class ArgReader {
public:
    explicit ArgReader(const json& args) : args_(args) {
        if (!args_.is_object() && !args_.is_null()) fail("arguments must be a JSON object");
    }

    std::string str(const char* key) {
        auto v = find(key);
        if (!v) {
            fail(fmt::format("missing required argument '{}'", key));
            return "";
        }
        if (!v->is_string()) {
            fail(fmt::format("argument '{}' must be a string", key));
            return "";
        }
        return v->get<std::string>();
    }

    std::string str_or(const char* key, const std::string& fallback) {
        auto v = find(key);
        if (!v) return fallback;
        if (!v->is_string()) {
            fail(fmt::format("argument '{}' must be a string", key));
            return fallback;
        }
        return v->get<std::string>();
    }

    std::optional<int64_t> opt_int(const char* key) {
        auto v = find(key);
        if (!v) return std::nullopt;
        if (!v->is_number_integer()) {
            fail(fmt::format("argument '{}' must be an integer", key));
            return std::nullopt;
        }
        return v->get<int64_t>();
    }

    int64_t integer(const char* key) {
        auto v = opt_int(key);
        if (!v && error_.empty()) fail(fmt::format("missing required argument '{}'", key));
        return v.value_or(0);
    }

    bool flag(const char* key, bool fallback) {
        auto v = find(key);
        if (!v) return fallback;
        if (!v->is_boolean()) {
            fail(fmt::format("argument '{}' must be true or false", key));
            return fallback;
        }
        return v->get<bool>();
    }

    OutputMode mode() {
        std::string name = str_or("response_format", "text");
        auto m = parse_output_mode(name);
        if (!m) {
            fail("response_format must be 'text' or 'json'");
            return OutputMode::Text;
        }
        return *m;
    }

    bool ok() const { return error_.empty(); }
    ToolReply error() const { return ToolDispatcher::failure(ErrorKind::InvalidArgument, error_); }

private:
    const json& args_;
    std::string error_;

    const json* find(const char* key) const {
        if (!args_.is_object()) return nullptr;
        auto it = args_.find(key);
        if (it == args_.end() || it->is_null()) return nullptr;
        return &*it;
    }

    void fail(const std::string& msg) {
        if (error_.empty()) error_ = msg;
    }
};

std::string suggestion_for(const std::string& message, ErrorKind kind) {
    if (kind == ErrorKind::TransferNotFound) return NEW_TRANSFER_HINT;
    if (message.find("not found or not accessible") != std::string::npos) return LIST_CONTAINERS_HINT;
    if (message.find("container support is not enabled") != std::string::npos) {
        return ENABLE_CONTAINERS_HINT;
    }
    if (kind == ErrorKind::PermissionDenied) {
        return "Set I_ACCEPT_RISKS=true (or security.accept_risks) to allow remote operations";
    }
    return "";
}

template <typename T>
ToolReply from_error(const Result<T>& r) {
    return ToolDispatcher::failure(r.kind, r.error, suggestion_for(r.error, r.kind));
}

ToolReply ok(json content) {
    return ToolReply{true, std::move(content)};
}

json report_json(const TransferReport& r) {
    json j = {
        {"success", true},
        {"source", r.source},
        {"destination", r.destination},
        {"bytes_transferred", r.bytes_transferred},
        {"duration_ms", r.duration.count()},
        {"transfer_speed", r.bytes_per_second()},
    };
    if (r.permissions) j["permissions"] = fmt::format("{:o}", *r.permissions);
    if (r.ctid) j["ctid"] = *r.ctid;
    return j;
}

} // namespace

std::string dump_json(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

ToolDispatcher::ToolDispatcher(ExposedToolSet exposed, ToolServices services)
    : exposed_(std::move(exposed)), services_(services) {
    register_core();
    if (services_.containers) register_containers();
    if (services_.transfers) register_transfers();

    for (const auto& name : exposed_.names()) {
        if (!handlers_.count(name)) {
            rexec_warn(fmt::format("Tool {} is exposed but has no backing service", name));
        }
    }
}

ToolReply ToolDispatcher::failure(ErrorKind kind, const std::string& message,
                                  const std::string& suggestion) {
    json j = {
        {"success", false},
        {"error", message},
        {"error_kind", error_kind_name(kind)},
    };
    if (!suggestion.empty()) j["suggestion"] = suggestion;
    return ToolReply{false, j};
}

ToolReply ToolDispatcher::call(const std::string& tool, const json& arguments) {
    auto it = handlers_.find(tool);
    if (!exposed_.contains(tool) || it == handlers_.end()) {
        return failure(ErrorKind::InvalidArgument, "Unknown tool: " + tool,
                       "Run `rexec tools` to list the available tools");
    }

    rexec_debug("Tool call: " + tool);
    try {
        ToolReply reply = it->second(arguments);
        if (!reply.success) {
            rexec_warn(fmt::format("{} failed: {}", tool,
                                   reply.content.is_object() ? reply.content.value("error", "") : ""));
        }
        return reply;
    } catch (const json::exception& e) {
        return failure(ErrorKind::InvalidArgument, fmt::format("Bad arguments for {}: {}", tool, e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
        return failure(ErrorKind::LocalIo, e.what());
    }
}

std::string ToolDispatcher::handle_line(const std::string& line) {
    json request = json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        json response = {
            {"success", false},
            {"result", failure(ErrorKind::InvalidArgument, "Request is not a JSON object").content},
        };
        return dump_json(response);
    }

    json response;
    auto tool = request.find("tool");
    if (tool == request.end() || !tool->is_string()) {
        response = {
            {"success", false},
            {"result", failure(ErrorKind::InvalidArgument, "Request has no 'tool' name").content},
        };
    } else {
        json args = request.value("arguments", json::object());
        ToolReply reply = call(tool->get<std::string>(), args);
        response = {
            {"tool", *tool},
            {"success", reply.success},
            {"result", reply.content},
        };
    }
    if (request.contains("id")) response["id"] = request["id"];
    return dump_json(response);
}

// ── Registration ────────────────────────────────────────────

void ToolDispatcher::register_core() {
    handlers_[tools::SSH_EXEC_COMMAND] = [this](const json& a) { return exec_command(a); };
    if (services_.files) {
        handlers_[tools::SSH_UPLOAD_FILE] = [this](const json& a) { return upload_file(a); };
        handlers_[tools::SSH_DOWNLOAD_FILE] = [this](const json& a) { return download_file(a); };
    }
}

void ToolDispatcher::register_containers() {
    handlers_[tools::CONTAINER_EXEC] = [this](const json& a) { return container_exec(a); };
    handlers_[tools::CONTAINER_LIST] = [this](const json& a) { return container_list(a); };
    handlers_[tools::CONTAINER_STATUS] = [this](const json& a) { return container_status(a); };
    handlers_[tools::CONTAINER_START] = [this](const json& a) { return container_power(a, true); };
    handlers_[tools::CONTAINER_STOP] = [this](const json& a) { return container_power(a, false); };
    if (services_.files) {
        handlers_[tools::CONTAINER_UPLOAD] = [this](const json& a) { return container_upload(a); };
        handlers_[tools::CONTAINER_DOWNLOAD] = [this](const json& a) { return container_download(a); };
    }
}

void ToolDispatcher::register_transfers() {
    handlers_[tools::TRANSFER_REQUEST_UPLOAD] = [this](const json& a) { return request_upload(a); };
    handlers_[tools::TRANSFER_CONFIRM_UPLOAD] = [this](const json& a) { return confirm_upload(a); };
    handlers_[tools::TRANSFER_REQUEST_DOWNLOAD] = [this](const json& a) { return request_download(a); };
    handlers_[tools::TRANSFER_CONFIRM_DOWNLOAD] = [this](const json& a) { return confirm_download(a); };
}

// ── Core tools ──────────────────────────────────────────────

ToolReply ToolDispatcher::exec_command(const json& a) {
    ArgReader args(a);
    std::string command = args.str("command");
    auto timeout = args.opt_int("timeout");
    OutputMode mode = args.mode();
    if (!args.ok()) return args.error();

    auto r = services_.session->exec(command, timeout);
    if (r.is_err()) return from_error(r);

    const auto& cfg = *services_.config;
    std::optional<ExecMetadata> meta;
    if (mode == OutputMode::Text) meta = ExecMetadata{cfg.host().host, cfg.host().username, now_iso()};
    auto out = OutputFormatter::format(r.value, static_cast<size_t>(cfg.security().character_limit),
                                       mode, meta);
    if (mode == OutputMode::Json) return ok(OutputFormatter::to_json(out));
    return ok(out.body);
}

ToolReply ToolDispatcher::upload_file(const json& a) {
    ArgReader args(a);
    std::string local = args.str("local_path");
    std::string remote = args.str("remote_path");
    auto perms = args.opt_int("permissions");
    bool overwrite = args.flag("overwrite", false);
    if (!args.ok()) return args.error();

    auto r = services_.files->upload(local, remote, perms, overwrite);
    if (r.is_err()) return from_error(r);
    return ok(report_json(r.value));
}

ToolReply ToolDispatcher::download_file(const json& a) {
    ArgReader args(a);
    std::string remote = args.str("remote_path");
    std::string local = args.str("local_path");
    bool overwrite = args.flag("overwrite", false);
    if (!args.ok()) return args.error();

    auto r = services_.files->download(remote, local, overwrite);
    if (r.is_err()) return from_error(r);
    return ok(report_json(r.value));
}

// ── Container tools ─────────────────────────────────────────

ToolReply ToolDispatcher::container_exec(const json& a) {
    ArgReader args(a);
    int64_t ctid = args.integer("ctid");
    std::string command = args.str("command");
    auto timeout = args.opt_int("timeout");
    OutputMode mode = args.mode();
    if (!args.ok()) return args.error();

    auto r = services_.containers->exec(ctid, command, timeout);
    if (r.is_err()) return from_error(r);
    auto out = OutputFormatter::format(
        r.value, static_cast<size_t>(services_.config->security().character_limit), mode);
    if (mode == OutputMode::Json) {
        json j = OutputFormatter::to_json(out);
        j["ctid"] = ctid;
        return ok(j);
    }
    return ok(fmt::format("Container: {}\n\n{}", ctid, out.body));
}

ToolReply ToolDispatcher::container_list(const json& a) {
    ArgReader args(a);
    OutputMode mode = args.mode();
    if (!args.ok()) return args.error();

    auto r = services_.containers->list();
    if (r.is_err()) return from_error(r);

    if (mode == OutputMode::Json) {
        json list = json::array();
        for (const auto& c : r.value) {
            list.push_back({{"ctid", c.ctid}, {"status", c.status}, {"name", c.name}});
        }
        return ok({{"containers", list}, {"count", r.value.size()}});
    }
    if (r.value.empty()) return ok("No containers found");
    std::string text = fmt::format("{:<10} {:<10} {}\n", "CTID", "STATUS", "NAME");
    for (const auto& c : r.value) {
        text += fmt::format("{:<10} {:<10} {}\n", c.ctid, c.status, c.name);
    }
    text += fmt::format("\n{} container(s)", r.value.size());
    return ok(text);
}

ToolReply ToolDispatcher::container_status(const json& a) {
    ArgReader args(a);
    int64_t ctid = args.integer("ctid");
    OutputMode mode = args.mode();
    if (!args.ok()) return args.error();

    auto r = services_.containers->status(ctid);
    if (r.is_err()) return from_error(r);
    if (mode == OutputMode::Json) return ok({{"ctid", ctid}, {"status", r.value}});
    return ok(fmt::format("Container {}: {}", ctid, r.value));
}

ToolReply ToolDispatcher::container_power(const json& a, bool start) {
    ArgReader args(a);
    int64_t ctid = args.integer("ctid");
    if (!args.ok()) return args.error();

    auto r = start ? services_.containers->start(ctid) : services_.containers->stop(ctid);
    if (r.is_err()) return from_error(r);
    return ok({{"success", true},
               {"ctid", ctid},
               {"message", fmt::format("Container {} {}", ctid, start ? "started" : "stopped")}});
}

ToolReply ToolDispatcher::container_upload(const json& a) {
    ArgReader args(a);
    int64_t ctid = args.integer("ctid");
    std::string local = args.str("local_path");
    std::string remote = args.str("remote_path");
    auto perms = args.opt_int("permissions");
    bool overwrite = args.flag("overwrite", false);
    if (!args.ok()) return args.error();

    auto r = services_.files->upload(local, remote, perms, overwrite, ctid);
    if (r.is_err()) return from_error(r);
    return ok(report_json(r.value));
}

ToolReply ToolDispatcher::container_download(const json& a) {
    ArgReader args(a);
    int64_t ctid = args.integer("ctid");
    std::string remote = args.str("remote_path");
    std::string local = args.str("local_path");
    bool overwrite = args.flag("overwrite", false);
    if (!args.ok()) return args.error();

    auto r = services_.files->download(remote, local, overwrite, ctid);
    if (r.is_err()) return from_error(r);
    return ok(report_json(r.value));
}

// ── Two-phase transfer tools ────────────────────────────────

ToolReply ToolDispatcher::request_upload(const json& a) {
    ArgReader args(a);
    std::string remote = args.str("remote_path");
    auto perms = args.opt_int("permissions");
    bool overwrite = args.flag("overwrite", false);
    auto ctid = args.opt_int("ctid");
    if (!args.ok()) return args.error();

    auto r = services_.transfers->request_upload(remote, perms, overwrite, ctid);
    if (r.is_err()) return from_error(r);
    const auto& t = r.value;
    return ok({
        {"transfer_id", t.transfer_id},
        {"upload_command", t.upload_command},
        {"upload_target", t.upload_target},
        {"expires_in", t.expires_in},
        {"remote_path", t.remote_path},
        {"next_step", fmt::format("Run upload_command with {} replaced by your file, then call {}",
                                  CLIENT_PATH_PLACEHOLDER, tools::TRANSFER_CONFIRM_UPLOAD)},
    });
}

ToolReply ToolDispatcher::confirm_upload(const json& a) {
    ArgReader args(a);
    std::string id = args.str("transfer_id");
    if (!args.ok()) return args.error();

    auto r = services_.transfers->confirm_upload(id);
    if (r.is_err()) return from_error(r);
    return ok({
        {"success", r.value.success},
        {"message", r.value.message},
        {"remote_path", r.value.remote_path},
        {"bytes_transferred", r.value.bytes_transferred},
    });
}

ToolReply ToolDispatcher::request_download(const json& a) {
    ArgReader args(a);
    std::string remote = args.str("remote_path");
    auto ctid = args.opt_int("ctid");
    if (!args.ok()) return args.error();

    auto r = services_.transfers->request_download(remote, ctid);
    if (r.is_err()) return from_error(r);
    const auto& t = r.value;
    return ok({
        {"transfer_id", t.transfer_id},
        {"download_url", t.download_url},
        {"download_command", t.download_command},
        {"expires_in", t.expires_in},
        {"remote_path", t.remote_path},
        {"size", t.size},
        {"next_step", fmt::format("Run download_command with {} replaced by a local path, then call {}",
                                  CLIENT_PATH_PLACEHOLDER, tools::TRANSFER_CONFIRM_DOWNLOAD)},
    });
}

ToolReply ToolDispatcher::confirm_download(const json& a) {
    ArgReader args(a);
    std::string id = args.str("transfer_id");
    if (!args.ok()) return args.error();

    auto r = services_.transfers->confirm_download(id);
    if (r.is_err()) return from_error(r);
    return ok({
        {"success", r.value.success},
        {"message", r.value.message},
        {"remote_path", r.value.remote_path},
    });
}

// ── Discovery ───────────────────────────────────────────────

std::string ToolDispatcher::tool_description(const std::string& name) {
    static const std::map<std::string, std::string> descriptions = {
        {tools::SSH_EXEC_COMMAND, "Run a bash command on the host (command, timeout?, response_format?)"},
        {tools::SSH_UPLOAD_FILE, "Copy a local file to the host (local_path, remote_path, permissions?, overwrite?)"},
        {tools::SSH_DOWNLOAD_FILE, "Copy a host file to this machine (remote_path, local_path, overwrite?)"},
        {tools::CONTAINER_EXEC, "Run a command in a container (ctid, command, timeout?, response_format?)"},
        {tools::CONTAINER_LIST, "List containers (response_format?)"},
        {tools::CONTAINER_STATUS, "Show a container's state (ctid, response_format?)"},
        {tools::CONTAINER_START, "Start a container (ctid)"},
        {tools::CONTAINER_STOP, "Stop a container (ctid)"},
        {tools::CONTAINER_UPLOAD, "Copy a local file into a container (ctid, local_path, remote_path, permissions?, overwrite?)"},
        {tools::CONTAINER_DOWNLOAD, "Copy a container file to this machine (ctid, remote_path, local_path, overwrite?)"},
        {tools::TRANSFER_REQUEST_UPLOAD, "Start a staged upload (remote_path, permissions?, overwrite?, ctid?)"},
        {tools::TRANSFER_CONFIRM_UPLOAD, "Finish a staged upload (transfer_id)"},
        {tools::TRANSFER_REQUEST_DOWNLOAD, "Stage a host file for download (remote_path, ctid?)"},
        {tools::TRANSFER_CONFIRM_DOWNLOAD, "Finish a staged download (transfer_id)"},
    };

    auto it = descriptions.find(name);
    return it == descriptions.end() ? "" : it->second;
}

std::vector<ToolSummary> ToolDispatcher::summaries(const ExposedToolSet& exposed) {
    std::vector<ToolSummary> out;
    for (const auto& name : exposed.names()) {
        out.push_back({name, exposed.owner(name), tool_description(name)});
    }
    return out;
}
