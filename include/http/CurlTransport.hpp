#pragma once

#include "http/Transport.hpp"

#include <string>
#include <curl/curl.h>

namespace ts::http {

struct BasicCredentials {
    std::string user;
    std::string password;
};

class CurlTransport final : public Transport {
public:
    explicit CurlTransport(BasicCredentials creds, long timeoutSeconds = 0);

    HttpResponse get(const std::string& url) override;
    HttpResponse stream(const std::string& url, const ChunkSink& sink) override;
    std::string escape(const std::string& value) override;

private:
    BasicCredentials creds_;
    long timeoutSeconds_;

    void applyDefaults(CURL* h) const;
};

}
