#pragma once

#include <string>
#include <core/config.hpp>
#include "intermediary.hpp"
#include "s3_signing.hpp"

// BlobIntermediary over an S3-compatible object store. The process talks to
// the store with presigned requests, the same URLs it hands to callers.
class S3Intermediary : public BlobIntermediary {
public:
    explicit S3Intermediary(const IntermediaryConfig& config, ClockFn clock = Clock::now);

    Result<UploadGrant> grant_upload(const std::string& key, std::chrono::seconds ttl) override;
    Result<bool> exists(const std::string& key) override;
    Result<std::string> fetch(const std::string& key, uint64_t max_bytes) override;
    Result<PublishedObject> publish(const std::string& key, const std::string& data,
                                    std::chrono::seconds ttl) override;
    Result<void> remove(const std::string& key) override;

    std::string presign(const std::string& method, const std::string& key,
                        std::chrono::seconds ttl) const;

private:
    IntermediaryConfig config_;
    ClockFn clock_;
    S3Credentials creds_;
    std::string scheme_;
    std::string authority_;
};
