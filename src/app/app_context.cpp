#include "app_context.hpp"
#include <capability/provider_table.hpp>
#include <core/log.hpp>
#include <ssh/libssh2_transport.hpp>
#include <transfer/s3_intermediary.hpp>
#include <fmt/format.h>

AppContext::AppContext(Config config) : config_(std::move(config)) {
}

Result<std::unique_ptr<AppContext>> AppContext::create(Config config, TransportFactory factory,
                                                       std::unique_ptr<BlobIntermediary> intermediary,
                                                       ClockFn clock) {
    using R = Result<std::unique_ptr<AppContext>>;

    auto valid = config.validate();
    if (valid.is_err()) return R::Err(valid);

    auto exposed = CapabilityRegistry::compose(core_tool_names(),
                                               build_provider_table(config.providers()));
    if (exposed.is_err()) return R::Err(exposed);

    std::unique_ptr<AppContext> ctx(new AppContext(std::move(config)));
    const Config& cfg = ctx->config_;

    if (!factory) {
        HostConfig host = cfg.host();
        factory = [host] { return std::make_unique<Libssh2Transport>(host); };
    }

    ctx->gate_ = std::make_unique<SecurityGate>(cfg.security());
    ctx->session_ = std::make_unique<SessionManager>(std::move(factory), *ctx->gate_);

    if (cfg.providers().containers) {
        ctx->containers_ = std::make_unique<ContainerService>(*ctx->session_, *ctx->gate_);
    }
    ctx->files_ = std::make_unique<FileTransferService>(*ctx->session_, *ctx->gate_,
                                                        ctx->containers_.get());

    if (cfg.providers().blob_transfer) {
        ctx->intermediary_ = intermediary ? std::move(intermediary)
                                          : std::make_unique<S3Intermediary>(cfg.intermediary(), clock);
        ctx->transfers_ = std::make_unique<TransferBridge>(
            *ctx->session_, *ctx->intermediary_, *ctx->gate_, cfg.transfer(),
            cfg.intermediary().key_prefix, ctx->containers_.get(), clock);
    }

    ToolServices services;
    services.config = &ctx->config_;
    services.session = ctx->session_.get();
    services.files = ctx->files_.get();
    services.containers = ctx->containers_.get();
    services.transfers = ctx->transfers_.get();
    ctx->dispatcher_ = std::make_unique<ToolDispatcher>(std::move(exposed.value), services);

    rexec_log(fmt::format("Ready: {}@{}:{}", cfg.host().username, cfg.host().host, cfg.host().port));
    return R::Ok(std::move(ctx));
}
