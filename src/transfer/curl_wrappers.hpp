#pragma once

#include <curl/curl.h>
#include <mutex>
#include <string>
#include <vector>

inline void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) return;
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() {
        if (h_) curl_easy_cleanup(h_);
    }
    bool valid() const { return h_ != nullptr; }
    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*() { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist* head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl = CURLE_OK;
    long http = 0;
    std::string body;
    std::string error;
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }

    static HttpResponse init_failed() {
        HttpResponse r;
        r.curl = CURLE_FAILED_INIT;
        r.error = "curl_easy_init failed";
        return r;
    }
};

template <class SetupFn>
HttpResponse perform_curl(SetupFn&& setup) {
    ensure_curl_global_init();
    CurlEasy h;
    if (!h.valid()) return HttpResponse::init_failed();
    std::string body_buf;
    char err_buf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud) {
        static_cast<std::string*>(ud)->append(p, s * n);
        return s * n;
    });
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body_buf);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, err_buf);

    setup(h);

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(body_buf);
    r.error = err_buf[0] ? err_buf : curl_easy_strerror(r.curl);
    return r;
}
