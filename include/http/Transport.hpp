#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace ts::http {

struct HttpResponse {
    int      curl  = 0;     // CURLcode, 0 = CURLE_OK
    long     http  = 0;
    std::string body;
    std::string error;

    [[nodiscard]] bool ok() const { return curl == 0 && http / 100 == 2; }
};

// Receives one body chunk; returning false aborts the transfer.
using ChunkSink = std::function<bool(const char* data, std::size_t len)>;

// All network I/O goes through here so the sync core can be driven without a network.
class Transport {
public:
    virtual ~Transport() = default;

    // Buffered GET, used for JSON API calls.
    virtual HttpResponse get(const std::string& url) = 0;

    // Streamed GET. The body of a non-2xx response never reaches the sink.
    virtual HttpResponse stream(const std::string& url, const ChunkSink& sink) = 0;

    virtual std::string escape(const std::string& value) = 0;
};

}
