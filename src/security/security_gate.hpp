#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <core/types.hpp>
#include <core/config.hpp>

// Input checks shared by every tool. Pure: nothing here touches the
// network or the filesystem.
class SecurityGate {
public:
    explicit SecurityGate(const SecurityConfig& config);

    // PermissionDenied unless the operator accepted the risks of remote exec.
    Result<void> check_risk_accepted() const;

    // Returns the lexically normalized path. Rejects empty paths, NUL bytes,
    // paths over the configured length and any ".." segment.
    Result<std::string> validate_path(const std::string& path) const;

    // 644 -> 0644. Every decimal digit must be an octal digit.
    static Result<unsigned> validate_permissions(int64_t value);

    Result<void> validate_command(const std::string& command) const;

    // Returns the effective timeout in seconds (default when unset).
    Result<int> validate_timeout(std::optional<int64_t> timeout_secs) const;

    Result<void> check_file_size(uint64_t bytes) const;

    static Result<int> validate_container_id(int64_t ctid);

    const SecurityConfig& config() const { return config_; }

private:
    SecurityConfig config_;
};
