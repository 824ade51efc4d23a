#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <core/types.hpp>

// Short-lived write access handed to the caller
struct UploadGrant {
    std::string url;
    std::string client_command;   // ready-to-run, with a <YOUR_FILE_PATH> placeholder
};

// Short-lived read access to a published object
struct PublishedObject {
    std::string url;
    std::string client_command;
};

// Blob storage used to stage bytes between the caller and the managed host.
// Every failure is reported as ErrorKind::Intermediary unless noted.
class BlobIntermediary {
public:
    virtual ~BlobIntermediary() = default;

    virtual Result<UploadGrant> grant_upload(const std::string& key,
                                             std::chrono::seconds ttl) = 0;
    virtual Result<bool> exists(const std::string& key) = 0;
    // SizeLimitExceeded when the object is larger than max_bytes
    virtual Result<std::string> fetch(const std::string& key, uint64_t max_bytes) = 0;
    virtual Result<PublishedObject> publish(const std::string& key, const std::string& data,
                                            std::chrono::seconds ttl) = 0;
    // Absent objects are not an error
    virtual Result<void> remove(const std::string& key) = 0;
};
