#include "s3_intermediary.hpp"
#include "curl_wrappers.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

// Requests made by this process are short; presign them for a few minutes
constexpr std::chrono::seconds INTERNAL_URL_TTL{300};

Result<void> http_failure(const std::string& what, const std::string& key, const HttpResponse& r) {
    if (r.curl != CURLE_OK) {
        return Result<void>::Err(ErrorKind::Intermediary,
                                 fmt::format("{} {} failed: {}", what, key, r.error));
    }
    return Result<void>::Err(ErrorKind::Intermediary,
                             fmt::format("{} {} failed: HTTP {}", what, key, r.http));
}

} // namespace

S3Intermediary::S3Intermediary(const IntermediaryConfig& config, ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
    creds_ = S3Credentials{config_.access_key, config_.secret_key, config_.region};

    std::string endpoint = config_.endpoint;
    auto sep = endpoint.find("://");
    scheme_ = (sep == std::string::npos) ? "https" : endpoint.substr(0, sep);
    authority_ = (sep == std::string::npos) ? endpoint : endpoint.substr(sep + 3);
    while (!authority_.empty() && authority_.back() == '/') authority_.pop_back();
}

std::string S3Intermediary::presign(const std::string& method, const std::string& key,
                                    std::chrono::seconds ttl) const {
    PresignRequest req;
    req.method = method;
    req.scheme = scheme_;
    if (config_.path_style) {
        req.host = authority_;
        req.canonical_uri = "/" + uri_encode(config_.bucket, true) + "/" + uri_encode(key, false);
    } else {
        req.host = config_.bucket + "." + authority_;
        req.canonical_uri = "/" + uri_encode(key, false);
    }
    req.amz_date = amz_timestamp(clock_());
    req.expires_secs = static_cast<long>(ttl.count());
    return presign_url(req, creds_);
}

Result<UploadGrant> S3Intermediary::grant_upload(const std::string& key, std::chrono::seconds ttl) {
    UploadGrant grant;
    grant.url = presign("PUT", key, ttl);
    grant.client_command = fmt::format("curl -fsS -X PUT --upload-file {} {}",
                                       shell_quote(CLIENT_PATH_PLACEHOLDER), shell_quote(grant.url));
    return Result<UploadGrant>::Ok(grant);
}

Result<bool> S3Intermediary::exists(const std::string& key) {
    std::string url = presign("HEAD", key, INTERNAL_URL_TTL);
    auto r = perform_curl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout));
    });
    if (r.curl == CURLE_OK && r.http == 404) return Result<bool>::Ok(false);
    if (!r.ok()) return Result<bool>::Err(http_failure("HEAD", key, r));
    return Result<bool>::Ok(true);
}

Result<std::string> S3Intermediary::fetch(const std::string& key, uint64_t max_bytes) {
    std::string url = presign("GET", key, INTERNAL_URL_TTL);
    auto r = perform_curl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout));
        curl_easy_setopt(h, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(max_bytes));
    });
    if (r.curl == CURLE_FILESIZE_EXCEEDED || r.body.size() > max_bytes) {
        return Result<std::string>::Err(ErrorKind::SizeLimitExceeded,
            fmt::format("Staged object exceeds the {} limit", format_bytes(max_bytes)));
    }
    if (!r.ok()) return Result<std::string>::Err(http_failure("GET", key, r));
    rexec_debug(fmt::format("Fetched {} ({} bytes)", key, r.body.size()));
    return Result<std::string>::Ok(std::move(r.body));
}

Result<PublishedObject> S3Intermediary::publish(const std::string& key, const std::string& data,
                                                std::chrono::seconds ttl) {
    std::string put_url = presign("PUT", key, INTERNAL_URL_TTL);
    SList headers;
    headers.add("Content-Type: application/octet-stream");
    auto r = perform_curl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, put_url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, data.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(data.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout));
    });
    if (!r.ok()) return Result<PublishedObject>::Err(http_failure("PUT", key, r));

    PublishedObject obj;
    obj.url = presign("GET", key, ttl);
    obj.client_command = fmt::format("curl -fsS -o {} {}", shell_quote(CLIENT_PATH_PLACEHOLDER),
                                     shell_quote(obj.url));
    rexec_debug(fmt::format("Published {} ({} bytes)", key, data.size()));
    return Result<PublishedObject>::Ok(obj);
}

Result<void> S3Intermediary::remove(const std::string& key) {
    std::string url = presign("DELETE", key, INTERNAL_URL_TTL);
    auto r = perform_curl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout));
    });
    if (r.curl == CURLE_OK && r.http == 404) return Result<void>::Ok();
    if (!r.ok()) return http_failure("DELETE", key, r);
    return Result<void>::Ok();
}
