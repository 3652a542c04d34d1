#include "storyguard/net/http.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace storyguard::net {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

EasyHandle make_handle() {
    // curl_global_init is not thread-safe, so it runs once per process.
    static std::once_flag once;
    static CURLcode global_status = CURLE_OK;
    std::call_once(once, [] { global_status = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (global_status != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init: ") + curl_easy_strerror(global_status));
    }
    EasyHandle handle(curl_easy_init());
    if (!handle) {
        throw std::runtime_error("curl_easy_init failed");
    }
    return handle;
}

// Collectors answer with an acknowledgement nobody reads; without a callback
// curl would print it to stdout, which carries service responses.
size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

void post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) {
    EasyHandle handle = make_handle();
    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        throw std::runtime_error("audit POST to " + url + " failed: " + curl_easy_strerror(code));
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw std::runtime_error("audit POST to " + url + " returned HTTP " + std::to_string(status));
    }
}

} // namespace storyguard::net
