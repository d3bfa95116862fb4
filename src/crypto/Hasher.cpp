#include "crypto/Hasher.hpp"
#include "log/Registry.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

using namespace ts::crypto;
using namespace ts::log;

namespace {

[[noreturn]] void throwOpenSSL(const std::string& what) {
    char buf[256] = {};
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    Registry::crypto()->error("[Hasher] {}: {}", what, buf);
    throw std::runtime_error(what + " failed");
}

}

void Hasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const { EVP_MD_CTX_free(ctx); }

Hasher::Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throwOpenSSL("EVP_MD_CTX_new");
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) throwOpenSSL("EVP_DigestInit_ex(sha256)");
}

Hasher::~Hasher() = default;
Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

void Hasher::update(const void* data, const std::size_t len) {
    if (finalized_) throw std::logic_error("Hasher::update called after finalHex()");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) throwOpenSSL("EVP_DigestUpdate");
}

std::string Hasher::finalHex() {
    if (finalized_) throw std::logic_error("Hasher::finalHex called twice");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &len) != 1) throwOpenSSL("EVP_DigestFinal_ex");
    finalized_ = true;

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return oss.str();
}

std::string Hasher::sha256Hex(const std::string_view data) {
    Hasher h;
    h.update(data);
    return h.finalHex();
}

std::string Hasher::hashFile(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        Registry::crypto()->error("[Hasher] Failed to open {} for hashing", filepath.string());
        throw std::runtime_error("Failed to open file for hashing: " + filepath.string());
    }

    Hasher h;
    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        h.update(buffer, static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        Registry::crypto()->error("[Hasher] Read error while hashing {}", filepath.string());
        throw std::runtime_error("Failed to read file for hashing: " + filepath.string());
    }

    auto digest = h.finalHex();
    Registry::crypto()->debug("[Hasher] {} -> {}", filepath.string(), digest);
    return digest;
}
