#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <stdexcept>
#include <type_traits>

namespace {

bool parse_bool(const std::string& raw) {
    std::string v = to_lower(raw);
    trim(v);
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

// Returns an error message when `raw` is not a whole integer.
std::optional<std::string> parse_int_env(const char* name, const char* raw, int64_t& out) {
    std::string v = raw;
    trim(v);
    auto parsed = safe_stoll(v);
    if (!parsed) {
        return fmt::format("{} must be an integer, got '{}'", name, v);
    }
    out = *parsed;
    return std::nullopt;
}

std::string expand_home(const std::string& path) {
    if (path.size() >= 1 && path[0] == '~') {
        return (platform::home_dir() / path.substr(path.size() > 1 ? 2 : 1)).string();
    }
    return path;
}

HostConfig parse_host(const YAML::Node& node) {
    HostConfig h;
    h.host = node["address"].as<std::string>("");
    h.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    h.username = node["username"].as<std::string>(DEFAULT_SSH_USERNAME);
    if (node["password"]) h.password = node["password"].as<std::string>();
    if (node["key_path"]) h.key_path = expand_home(node["key_path"].as<std::string>());
    if (node["key_data"]) h.key_data = node["key_data"].as<std::string>();
    if (node["key_passphrase"]) h.key_passphrase = node["key_passphrase"].as<std::string>();
    std::string mode = to_lower(node["host_key_mode"].as<std::string>("strict"));
    h.host_key_mode = (mode == "trusting") ? HostKeyMode::Trusting : HostKeyMode::Strict;
    h.known_hosts_path = expand_home(node["known_hosts"].as<std::string>(""));
    h.connect_timeout = node["connect_timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
    return h;
}

SecurityConfig parse_security(const YAML::Node& node) {
    SecurityConfig s;
    s.risk_accepted = node["accept_risks"].as<bool>(false);
    s.character_limit = node["character_limit"].as<int>(DEFAULT_CHARACTER_LIMIT);
    s.max_file_size = node["max_file_size"].as<int64_t>(DEFAULT_MAX_FILE_SIZE);
    s.default_timeout = node["default_timeout"].as<int>(DEFAULT_COMMAND_TIMEOUT_SECS);
    s.max_timeout = node["max_timeout"].as<int>(MAX_COMMAND_TIMEOUT_SECS);
    s.max_command_length = node["max_command_length"].as<int>(DEFAULT_MAX_COMMAND_LENGTH);
    s.max_path_length = node["max_path_length"].as<int>(DEFAULT_MAX_PATH_LENGTH);
    return s;
}

IntermediaryConfig parse_intermediary(const YAML::Node& node) {
    IntermediaryConfig i;
    i.endpoint = node["endpoint"].as<std::string>(i.endpoint);
    i.bucket = node["bucket"].as<std::string>("");
    i.region = node["region"].as<std::string>(i.region);
    i.access_key = node["access_key"].as<std::string>("");
    i.secret_key = node["secret_key"].as<std::string>("");
    i.key_prefix = node["key_prefix"].as<std::string>(DEFAULT_KEY_PREFIX);
    i.path_style = node["path_style"].as<bool>(true);
    i.request_timeout = node["request_timeout"].as<int>(DEFAULT_INTERMEDIARY_TIMEOUT_SECS);
    return i;
}

} // namespace

fs::path get_config_dir() {
    return platform::home_dir() / ".rexec";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<Config> Config::load(const std::optional<fs::path>& path) {
    fs::path config_path = path ? *path : get_config_path();
    if (!path) {
        if (const char* env_path = std::getenv("REXEC_CONFIG")) config_path = env_path;
    }

    std::string text;
    if (fs::exists(config_path)) {
        std::ifstream in(config_path);
        if (!in) {
            return Result<Config>::Err(ErrorKind::Configuration,
                                       "Cannot read config file: " + config_path.string());
        }
        std::stringstream buf;
        buf << in.rdbuf();
        text = buf.str();
    } else if (path) {
        return Result<Config>::Err(ErrorKind::Configuration,
                                   "Config file not found: " + config_path.string());
    }

    return from_yaml(text, [](const char* name) { return std::getenv(name); });
}

Result<Config> Config::from_yaml(const std::string& yaml_text,
                                 const std::function<const char*(const char*)>& getenv) {
    Config cfg;
    try {
        YAML::Node root = yaml_text.empty() ? YAML::Node() : YAML::Load(yaml_text);
        if (root["host"]) cfg.host_ = parse_host(root["host"]);
        if (root["security"]) cfg.security_ = parse_security(root["security"]);
        if (root["transfer"]) {
            cfg.transfer_.ttl_secs = root["transfer"]["ttl"].as<int>(DEFAULT_TRANSFER_TTL_SECS);
        }
        if (root["intermediary"]) cfg.intermediary_ = parse_intermediary(root["intermediary"]);
        if (root["providers"]) {
            cfg.providers_.containers = root["providers"]["containers"].as<bool>(false);
            cfg.providers_.blob_transfer = root["providers"]["blob_transfer"].as<bool>(false);
        }
        if (root["logging"]) {
            const auto& node = root["logging"];
            cfg.logging_.path = expand_home(node["path"].as<std::string>(""));
            cfg.logging_.mirror_stderr = node["stderr"].as<bool>(false);
            std::string level = node["level"].as<std::string>("info");
            auto parsed = parse_log_level(to_lower(level));
            if (!parsed) {
                return Result<Config>::Err(ErrorKind::Configuration,
                                           "Unknown log level: " + level);
            }
            cfg.logging_.level = *parsed;
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Configuration,
                                   std::string("Invalid config file: ") + e.what());
    }

    try {
        cfg.apply_env(getenv);
    } catch (const std::invalid_argument& e) {
        return Result<Config>::Err(ErrorKind::Configuration, e.what());
    }
    return Result<Config>::Ok(std::move(cfg));
}

void Config::apply_env(const std::function<const char*(const char*)>& getenv) {
    auto int_env = [&](const char* name, auto& field) {
        const char* raw = getenv(name);
        if (!raw) return;
        int64_t v = 0;
        if (auto err = parse_int_env(name, raw, v)) throw std::invalid_argument(*err);
        field = static_cast<std::remove_reference_t<decltype(field)>>(v);
    };
    auto str_env = [&](const char* name, std::string& field) {
        if (const char* raw = getenv(name)) field = raw;
    };
    auto opt_env = [&](const char* name, std::optional<std::string>& field) {
        if (const char* raw = getenv(name)) {
            if (*raw) field = std::string(raw);
        }
    };
    auto bool_env = [&](const char* name, bool& field) {
        if (const char* raw = getenv(name)) field = parse_bool(raw);
    };

    str_env("HOST", host_.host);
    int_env("SSH_PORT", host_.port);
    str_env("SSH_USERNAME", host_.username);
    opt_env("SSH_PASSWORD", host_.password);
    if (const char* key = getenv("SSH_KEY")) {
        if (*key) host_.key_path = expand_home(key);
    }
    opt_env("SSH_KEY_PASSPHRASE", host_.key_passphrase);
    if (const char* strict = getenv("SSH_STRICT_HOST_KEY_CHECKING")) {
        host_.host_key_mode = parse_bool(strict) ? HostKeyMode::Strict : HostKeyMode::Trusting;
    }

    bool_env("I_ACCEPT_RISKS", security_.risk_accepted);
    int_env("CHARACTER_LIMIT", security_.character_limit);
    int_env("MAX_FILE_SIZE", security_.max_file_size);
    int_env("TIMEOUT", security_.default_timeout);

    bool_env("ENABLE_PROXMOX", providers_.containers);
    bool_env("ENABLE_BLOB_TRANSFER", providers_.blob_transfer);
    int_env("BLOB_TRANSFER_TIMEOUT", transfer_.ttl_secs);

    str_env("S3_ENDPOINT", intermediary_.endpoint);
    str_env("S3_BUCKET", intermediary_.bucket);
    str_env("S3_REGION", intermediary_.region);
    str_env("S3_ACCESS_KEY", intermediary_.access_key);
    str_env("S3_SECRET_KEY", intermediary_.secret_key);
}

Result<void> Config::validate() const {
    auto fail = [](const std::string& msg) {
        return Result<void>::Err(ErrorKind::Configuration, msg);
    };

    if (host_.host.empty()) {
        return fail("No SSH host configured. Set host.address in the config file or HOST");
    }
    if (host_.port <= 0 || host_.port > 65535) {
        return fail(fmt::format("SSH port out of range: {}", host_.port));
    }
    if (host_.username.empty()) return fail("SSH username must not be empty");
    if (!host_.password && !host_.key_path && !host_.key_data) {
        return fail("No SSH credential configured. Set SSH_PASSWORD or SSH_KEY");
    }
    if (host_.key_path && !fs::exists(*host_.key_path)) {
        return fail("SSH key file not found: " + *host_.key_path);
    }
    if (host_.connect_timeout <= 0) return fail("connect_timeout must be positive");

    if (security_.character_limit <= 0) return fail("CHARACTER_LIMIT must be positive");
    if (security_.max_file_size <= 0) return fail("MAX_FILE_SIZE must be positive");
    if (security_.max_command_length <= 0) return fail("max_command_length must be positive");
    if (security_.max_path_length <= 0) return fail("max_path_length must be positive");
    if (security_.max_timeout <= 0 || security_.max_timeout > MAX_COMMAND_TIMEOUT_SECS) {
        return fail(fmt::format("max_timeout must be between 1 and {}", MAX_COMMAND_TIMEOUT_SECS));
    }
    if (security_.default_timeout <= 0 || security_.default_timeout > security_.max_timeout) {
        return fail(fmt::format("TIMEOUT must be between 1 and {}", security_.max_timeout));
    }

    if (transfer_.ttl_secs <= 0) return fail("Transfer TTL must be positive");
    if (providers_.blob_transfer) {
        if (intermediary_.bucket.empty()) {
            return fail("Blob transfer enabled but no bucket configured (S3_BUCKET)");
        }
        if (intermediary_.access_key.empty() || intermediary_.secret_key.empty()) {
            return fail("Blob transfer enabled but S3_ACCESS_KEY / S3_SECRET_KEY are missing");
        }
        if (intermediary_.request_timeout <= 0) return fail("request_timeout must be positive");
    }
    return Result<void>::Ok();
}

Result<void> create_default_config(const fs::path& config_path) {
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# rexec configuration
# Environment variables (HOST, SSH_KEY, I_ACCEPT_RISKS, ...) override these values.

host:
  address: ""
  port: 22
  username: "root"
  # password: ""
  # key_path: "~/.ssh/id_ed25519"
  # key_passphrase: ""
  host_key_mode: "strict"          # strict | trusting
  # known_hosts: "~/.ssh/known_hosts"
  connect_timeout: 30

security:
  accept_risks: false              # required for any command or transfer
  character_limit: 25000
  max_file_size: 10485760
  default_timeout: 30
  max_timeout: 300

transfer:
  ttl: 3600

providers:
  containers: false                # Proxmox pct tools
  blob_transfer: false             # two-phase transfers through object storage

# intermediary:
#   endpoint: "https://s3.amazonaws.com"
#   bucket: ""
#   region: "us-east-1"
#   access_key: ""
#   secret_key: ""
#   key_prefix: "rexec"

logging:
  level: "info"
  # path: "/tmp/rexec.log"
  stderr: false
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorKind::Configuration,
                                     "Failed to create config file at " + config_path.string());
        }
        out << default_config;
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::Configuration,
                                 "Failed to write config file: " + std::string(e.what()));
    }
}
