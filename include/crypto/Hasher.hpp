#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace ts::crypto {

// Incremental SHA-256. Feed bytes as they arrive, then finalize once.
class Hasher {
public:
    Hasher();
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    void update(const void* data, std::size_t len);
    void update(std::string_view data) { update(data.data(), data.size()); }

    // Lowercase hex digest. The hasher cannot be updated afterwards.
    [[nodiscard]] std::string finalHex();

    [[nodiscard]] bool finalized() const { return finalized_; }

    static std::string sha256Hex(std::string_view data);

    // Throws std::runtime_error if the file cannot be opened or read.
    static std::string hashFile(const std::filesystem::path& filepath);

private:
    struct CtxDeleter { void operator()(evp_md_ctx_st* ctx) const; };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool finalized_ = false;
};

}
