#include "http/CurlTransport.hpp"
#include "http/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace ts::http;

namespace {

struct StreamCtx {
    CURL* handle = nullptr;
    const ChunkSink* sink = nullptr;
    bool sinkRejected = false;
    std::string errorBody;
};

size_t streamWrite(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamCtx*>(userdata);
    const size_t n = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
    if (status / 100 != 2) {
        // keep a short excerpt of the error body for diagnostics only
        if (ctx->errorBody.size() < 512) ctx->errorBody.append(ptr, std::min<size_t>(n, 512));
        return n;
    }

    if (!(*ctx->sink)(ptr, n)) {
        ctx->sinkRejected = true;
        return 0; // CURLE_WRITE_ERROR
    }
    return n;
}

}

CurlTransport::CurlTransport(BasicCredentials creds, const long timeoutSeconds)
    : creds_(std::move(creds)), timeoutSeconds_(timeoutSeconds) {
    ensureCurlGlobalInit();
}

void CurlTransport::applyDefaults(CURL* h) const {
    curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(h, CURLOPT_USERNAME, creds_.user.c_str());
    curl_easy_setopt(h, CURLOPT_PASSWORD, creds_.password.c_str());
    if (timeoutSeconds_ > 0) curl_easy_setopt(h, CURLOPT_TIMEOUT, timeoutSeconds_);
}

HttpResponse CurlTransport::get(const std::string& url) {
    CurlEasy h;
    SList hdrs;
    hdrs.add("Content-Type: application/json");
    hdrs.add("Accept: application/json");

    HttpResponse r;
    applyDefaults(h);
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &r.body);

    const CURLcode rc = curl_easy_perform(h);
    r.curl = static_cast<int>(rc);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);

    if (rc != CURLE_OK) r.error = curl_easy_strerror(rc);
    else if (!r.ok()) r.error = fmt::format("HTTP status {}", r.http);

    if (!r.ok()) log::Registry::http()->warn("[CurlTransport] GET {} failed: {}", url, r.error);
    return r;
}

HttpResponse CurlTransport::stream(const std::string& url, const ChunkSink& sink) {
    CurlEasy h;
    StreamCtx ctx;
    ctx.handle = h;
    ctx.sink = &sink;

    HttpResponse r;
    applyDefaults(h);
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, streamWrite);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);

    const CURLcode rc = curl_easy_perform(h);
    r.curl = static_cast<int>(rc);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);

    if (ctx.sinkRejected) r.error = "download aborted: local write failed";
    else if (rc != CURLE_OK) r.error = curl_easy_strerror(rc);
    else if (!r.ok()) r.error = fmt::format("HTTP status {}", r.http);

    if (!r.ok()) {
        r.body = std::move(ctx.errorBody);
        log::Registry::http()->warn("[CurlTransport] stream {} failed: {}", url, r.error);
    }
    return r;
}

std::string CurlTransport::escape(const std::string& value) {
    CurlEasy h;
    char* esc = curl_easy_escape(h, value.c_str(), static_cast<int>(value.size()));
    if (!esc) throw std::runtime_error("curl_easy_escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}
