#include "http/curlWrappers.hpp"

#include <mutex>
#include <fmt/format.h>

namespace ts::http {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK)
            throw std::runtime_error(fmt::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
    });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

}
