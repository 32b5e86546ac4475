#pragma once

#include <chrono>
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace bk::util {

/** Ensure curl global init runs exactly once in process */
inline void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlEasy {
public:
    CurlEasy() : h_((ensureCurlGlobalInit(), curl_easy_init())) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }
    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

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
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string error;
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

inline size_t appendToString(char* p, size_t s, size_t n, void* ud) {
    static_cast<std::string*>(ud)->append(p, s * n);
    return s * n;
}

// Never throws for transport failures; they are reported through HttpResponse::curl/error.
template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup, const std::chrono::milliseconds timeout) {
    HttpResponse r;
    try {
        CurlEasy h;                    // RAII handle
        std::string bodyBuf;
        char errBuf[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendToString);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &bodyBuf);
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errBuf);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));

        setup(h);                      // caller-specific tweaks

        r.curl = curl_easy_perform(h);
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
        r.body.swap(bodyBuf);
        if (r.curl != CURLE_OK) r.error = errBuf[0] ? std::string(errBuf) : curl_easy_strerror(r.curl);
    } catch (const std::exception& e) {
        r.curl = CURLE_FAILED_INIT;
        r.error = e.what();
    }
    return r;
}

}
