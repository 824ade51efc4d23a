#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include "types.hpp"
#include "constants.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

enum class HostKeyMode { Strict, Trusting };

struct HostConfig {
    std::string host;
    int port = DEFAULT_SSH_PORT;
    std::string username = DEFAULT_SSH_USERNAME;
    std::optional<std::string> password;
    std::optional<std::string> key_path;
    std::optional<std::string> key_data;          // in-memory PEM/OpenSSH key
    std::optional<std::string> key_passphrase;
    HostKeyMode host_key_mode = HostKeyMode::Strict;
    std::string known_hosts_path;                 // empty = ~/.ssh/known_hosts
    int connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
};

struct SecurityConfig {
    bool risk_accepted = false;
    int character_limit = DEFAULT_CHARACTER_LIMIT;
    int64_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    int default_timeout = DEFAULT_COMMAND_TIMEOUT_SECS;
    int max_timeout = MAX_COMMAND_TIMEOUT_SECS;
    int max_command_length = DEFAULT_MAX_COMMAND_LENGTH;
    int max_path_length = DEFAULT_MAX_PATH_LENGTH;
};

struct TransferConfig {
    int ttl_secs = DEFAULT_TRANSFER_TTL_SECS;
};

// S3-compatible object store used as the blob intermediary
struct IntermediaryConfig {
    std::string endpoint = "https://s3.amazonaws.com";
    std::string bucket;
    std::string region = "us-east-1";
    std::string access_key;
    std::string secret_key;
    std::string key_prefix = DEFAULT_KEY_PREFIX;
    bool path_style = true;
    int request_timeout = DEFAULT_INTERMEDIARY_TIMEOUT_SECS;
};

struct ProviderFlags {
    bool containers = false;
    bool blob_transfer = false;
};

class Config {
public:
    // Load ~/.rexec/config.yaml (or `path`), then apply environment overrides
    static Result<Config> load(const std::optional<fs::path>& path = std::nullopt);

    // Parse YAML text and apply overrides from `getenv`; used by load().
    // Neither validates; AppContext::create does.
    static Result<Config> from_yaml(const std::string& yaml_text,
                                    const std::function<const char*(const char*)>& getenv);

    Result<void> validate() const;

    const HostConfig& host() const { return host_; }
    const SecurityConfig& security() const { return security_; }
    const TransferConfig& transfer() const { return transfer_; }
    const IntermediaryConfig& intermediary() const { return intermediary_; }
    const ProviderFlags& providers() const { return providers_; }
    const LogSettings& logging() const { return logging_; }

    Config() = default;

private:
    HostConfig host_;
    SecurityConfig security_;
    TransferConfig transfer_;
    IntermediaryConfig intermediary_;
    ProviderFlags providers_;
    LogSettings logging_;

    void apply_env(const std::function<const char*(const char*)>& getenv);
};

fs::path get_config_dir();
fs::path get_config_path();

// Write a commented default config if none exists
Result<void> create_default_config(const fs::path& path);
