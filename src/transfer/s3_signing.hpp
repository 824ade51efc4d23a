#pragma once

#include <chrono>
#include <string>

// AWS Signature Version 4 helpers for S3-compatible object stores.

struct S3Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region;
};

struct PresignRequest {
    std::string method;          // GET, PUT, HEAD, DELETE
    std::string scheme;          // http or https
    std::string host;            // authority as sent in the Host header
    std::string canonical_uri;   // already URI-encoded, starts with '/'
    std::string amz_date;        // YYYYMMDDTHHMMSSZ
    long expires_secs = 3600;
};

std::string sha256_hex(const std::string& data);
std::string hmac_sha256_raw(const std::string& key, const std::string& data);
std::string to_hex(const std::string& raw);

// RFC 3986 encoding as S3 expects it. '/' is kept unless encode_slash.
std::string uri_encode(const std::string& s, bool encode_slash);

std::string amz_timestamp(std::chrono::system_clock::time_point t);

// Query-string presigned URL (X-Amz-Signature appended last)
std::string presign_url(const PresignRequest& req, const S3Credentials& creds);

// Signature alone, for tests against published vectors
std::string presign_signature(const PresignRequest& req, const S3Credentials& creds);
