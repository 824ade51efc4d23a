#pragma once

#include <memory>
#include <core/config.hpp>
#include <core/types.hpp>
#include <capability/capability_registry.hpp>
#include <security/security_gate.hpp>
#include <services/container_service.hpp>
#include <services/file_transfer_service.hpp>
#include <ssh/session_manager.hpp>
#include <transfer/intermediary.hpp>
#include <transfer/transfer_bridge.hpp>
#include "tool_dispatcher.hpp"

// Every component of one process, built once at startup. Members are
// declared in dependency order so teardown runs dependents first.
class AppContext {
public:
    // Validates `config`, composes the exposed tool set and wires the
    // services behind it. Empty `factory` / `intermediary` select libssh2
    // and S3.
    static Result<std::unique_ptr<AppContext>> create(
        Config config, TransportFactory factory = nullptr,
        std::unique_ptr<BlobIntermediary> intermediary = nullptr,
        ClockFn clock = Clock::now);

    const Config& config() const { return config_; }
    SessionManager& session() { return *session_; }
    ToolDispatcher& dispatcher() { return *dispatcher_; }
    TransferBridge* transfers() { return transfers_.get(); }

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

private:
    explicit AppContext(Config config);

    Config config_;
    std::unique_ptr<SecurityGate> gate_;
    std::unique_ptr<BlobIntermediary> intermediary_;
    std::unique_ptr<SessionManager> session_;
    std::unique_ptr<ContainerService> containers_;
    std::unique_ptr<FileTransferService> files_;
    std::unique_ptr<TransferBridge> transfers_;
    std::unique_ptr<ToolDispatcher> dispatcher_;
};
