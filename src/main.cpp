#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "app/app_context.hpp"
#include "capability/provider_table.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"

namespace {

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage("rexec serve", "", "Answer JSON tool calls on stdin, one per line");
    std::cout << theme::usage("rexec tools", "", "List the tools this configuration exposes");
    std::cout << theme::usage("rexec call", "<tool> [json]", "Run one tool and print its result");
    std::cout << theme::usage("rexec init", "", "Write a default config file");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <path>       Use this config file (default ~/.rexec/config.yaml)\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

// Loads config and applies its logging settings
Result<Config> load_config(const std::optional<fs::path>& path) {
    auto cfg = Config::load(path);
    if (cfg.is_ok()) rexec_log_configure(cfg.value.logging());
    return cfg;
}

int run_init(const std::optional<fs::path>& path) {
    fs::path target = path ? *path : get_config_path();
    auto r = create_default_config(target);
    if (r.is_err()) {
        std::cerr << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Config at " + target.string());
    std::cout << theme::step("Set host.address and a credential, then run `rexec tools`");
    return 0;
}

int run_tools(const std::optional<fs::path>& path) {
    auto cfg = load_config(path);
    if (cfg.is_err()) {
        std::cerr << theme::fail(cfg.error);
        return 1;
    }
    auto exposed = CapabilityRegistry::compose(core_tool_names(),
                                               build_provider_table(cfg.value.providers()));
    if (exposed.is_err()) {
        std::cerr << theme::fail(exposed.error);
        return 1;
    }

    std::cout << theme::section("Tools");
    for (const auto& t : ToolDispatcher::summaries(exposed.value)) {
        std::cout << theme::kv(t.name, t.description + theme::dim(" [" + t.owner + "]"));
    }
    std::cout << "\n" << theme::dim("  Log: " + rexec_log_path()) << "\n\n";
    return 0;
}

Result<std::unique_ptr<AppContext>> build_context(const std::optional<fs::path>& path) {
    auto cfg = load_config(path);
    if (cfg.is_err()) return Result<std::unique_ptr<AppContext>>::Err(cfg);
    return AppContext::create(std::move(cfg.value));
}

int run_serve(const std::optional<fs::path>& path) {
    auto ctx = build_context(path);
    if (ctx.is_err()) {
        rexec_error(ctx.error);
        std::cerr << theme::fail(ctx.error);
        return 1;
    }

    rexec_log("Serving tool calls on stdin");
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        std::cout << ctx.value->dispatcher().handle_line(line) << "\n" << std::flush;
    }
    ctx.value->session().close();
    rexec_log("stdin closed, exiting");
    return 0;
}

int run_call(const std::optional<fs::path>& path, const std::string& tool,
             const std::string& args_text) {
    auto args = nlohmann::json::parse(args_text.empty() ? "{}" : args_text, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        std::cerr << theme::fail("Arguments must be a JSON object");
        return 1;
    }

    auto ctx = build_context(path);
    if (ctx.is_err()) {
        std::cerr << theme::fail(ctx.error);
        return 1;
    }

    ToolReply reply = ctx.value->dispatcher().call(tool, args);
    if (reply.content.is_string()) {
        std::cout << reply.content.get<std::string>() << "\n";
    } else {
        std::cout << dump_json(reply.content, 2) << "\n";
    }
    ctx.value->session().close();
    return reply.success ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::optional<fs::path> config_path;
        std::vector<std::string> args;
        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--config") {
                if (i + 1 >= argc) {
                    std::cerr << theme::fail("--config needs a path");
                    return 1;
                }
                config_path = fs::path(argv[++i]);
            } else {
                args.push_back(a);
            }
        }

        if (args.empty() || args[0] == "--help") {
            print_usage();
            return args.empty() ? 1 : 0;
        }

        const std::string& cmd = args[0];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "rexec"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << REXEC_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "serve") {
            return run_serve(config_path);
        } else if (cmd == "tools") {
            return run_tools(config_path);
        } else if (cmd == "init") {
            return run_init(config_path);
        } else if (cmd == "call") {
            if (args.size() < 2) {
                std::cerr << theme::fail("Missing tool name.");
                std::cerr << theme::step("Usage: rexec call <tool> [json-arguments]");
                return 1;
            }
            return run_call(config_path, args[1], args.size() >= 3 ? args[2] : "");
        } else {
            std::cerr << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        rexec_error(std::string("Fatal: ") + e.what());
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
