#include "s3_signing.hpp"
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <fmt/format.h>
#include <ctime>

namespace {

constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";

std::string credential_scope(const PresignRequest& req, const S3Credentials& creds) {
    return req.amz_date.substr(0, 8) + "/" + creds.region + "/s3/aws4_request";
}

// Query parameters in canonical (sorted) order, without the signature
std::string canonical_query(const PresignRequest& req, const S3Credentials& creds) {
    std::string credential = creds.access_key + "/" + credential_scope(req, creds);
    return fmt::format("X-Amz-Algorithm={}&X-Amz-Credential={}&X-Amz-Date={}"
                       "&X-Amz-Expires={}&X-Amz-SignedHeaders=host",
                       ALGORITHM, uri_encode(credential, true), req.amz_date,
                       req.expires_secs);
}

} // namespace

std::string to_hex(const std::string& raw) {
    std::string out;
    out.reserve(raw.size() * 2);
    for (unsigned char c : raw) out += fmt::format("{:02x}", c);
    return out;
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(std::string(reinterpret_cast<char*>(hash), SHA256_DIGEST_LENGTH));
}

std::string hmac_sha256_raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len);
    return std::string(reinterpret_cast<char*>(digest), len);
}

std::string uri_encode(const std::string& s, bool encode_slash) {
    std::string out;
    for (unsigned char c : s) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            out += static_cast<char>(c);
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

std::string amz_timestamp(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    struct tm tm_buf;
    gmtime_r(&tt, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_buf);
    return buf;
}

std::string presign_signature(const PresignRequest& req, const S3Credentials& creds) {
    std::string canonical_request = req.method + "\n" +
                                    req.canonical_uri + "\n" +
                                    canonical_query(req, creds) + "\n" +
                                    "host:" + req.host + "\n\n" +
                                    "host\n" +
                                    "UNSIGNED-PAYLOAD";

    std::string string_to_sign = std::string(ALGORITHM) + "\n" +
                                 req.amz_date + "\n" +
                                 credential_scope(req, creds) + "\n" +
                                 sha256_hex(canonical_request);

    std::string k_date    = hmac_sha256_raw("AWS4" + creds.secret_key, req.amz_date.substr(0, 8));
    std::string k_region  = hmac_sha256_raw(k_date, creds.region);
    std::string k_service = hmac_sha256_raw(k_region, "s3");
    std::string k_signing = hmac_sha256_raw(k_service, "aws4_request");

    return to_hex(hmac_sha256_raw(k_signing, string_to_sign));
}

std::string presign_url(const PresignRequest& req, const S3Credentials& creds) {
    return fmt::format("{}://{}{}?{}&X-Amz-Signature={}", req.scheme, req.host,
                       req.canonical_uri, canonical_query(req, creds),
                       presign_signature(req, creds));
}
