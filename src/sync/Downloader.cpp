#include "sync/Downloader.hpp"
#include "crypto/Hasher.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>
#include <fmt/format.h>

using namespace ts::sync;
using namespace ts::log;
namespace fs = std::filesystem;

namespace {

void discard(const fs::path& tmp) {
    std::error_code ec;
    fs::remove(tmp, ec);
    if (ec) Registry::sync()->warn("[Downloader] Could not remove {}: {}", tmp.string(), ec.message());
}

bool occupied(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

bool writeAll(const int fd, const char* data, std::size_t len) {
    while (len > 0) {
        const auto n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

}

Downloader::Downloader(std::shared_ptr<http::Transport> transport) : transport_(std::move(transport)) {
    if (!transport_) throw std::invalid_argument("Downloader requires a transport");
}

fs::path Downloader::tempPathFor(const fs::path& destination) {
    auto tmp = destination;
    tmp += ".temp";
    return tmp;
}

fs::path Downloader::freeDestination(const fs::path& destination) {
    const auto parent = destination.parent_path();
    const auto stem = destination.stem().string();
    const auto ext = destination.extension().string();

    fs::path candidate = destination;
    for (unsigned int n = 1; occupied(candidate) || occupied(tempPathFor(candidate)); ++n)
        candidate = parent / fmt::format("{}({}){}", stem, n, ext);
    return candidate;
}

DownloadResult Downloader::download(const std::string& url, const fs::path& requested, HashSet& knownHashes) const {
    const auto destination = freeDestination(requested);
    const auto tmp = tempPathFor(destination);
    bool created = false;

    try {
        crypto::Hasher hasher;
        http::HttpResponse res;

        const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) return Failed{fmt::format("cannot create {}: {}", tmp.string(), std::strerror(errno))};
        created = true;

        int writeErr = 0;
        try {
            res = transport_->stream(url, [&](const char* data, const std::size_t len) {
                if (!writeAll(fd, data, len)) {
                    writeErr = errno;
                    return false;
                }
                hasher.update(data, len);
                return true;
            });
        } catch (...) {
            ::close(fd);
            throw;
        }

        if (::close(fd) != 0 && writeErr == 0) writeErr = errno;
        if (res.ok() && writeErr != 0) {
            discard(tmp);
            return Failed{fmt::format("write failed for {}: {}", tmp.string(), std::strerror(writeErr))};
        }

        if (!res.ok()) {
            discard(tmp);
            Registry::sync()->error("[Downloader] {} failed: {}", url, res.error);
            return Failed{res.error.empty() ? fmt::format("HTTP status {}", res.http) : res.error};
        }

        auto digest = hasher.finalHex();

        if (!knownHashes.tryClaim(digest)) {
            discard(tmp);
            Registry::sync()->warn("[Downloader] Skipping {}: identical content already downloaded",
                                   destination.filename().string());
            return Duplicate{std::move(digest)};
        }

        // Never replace a file that appeared while streaming
        if (occupied(destination)) {
            knownHashes.release(digest);
            discard(tmp);
            Registry::sync()->error("[Downloader] {} appeared during download, not replaced", destination.string());
            return Failed{fmt::format("{} already exists", destination.string())};
        }

        std::error_code ec;
        fs::rename(tmp, destination, ec);
        if (ec) {
            knownHashes.release(digest);
            discard(tmp);
            Registry::sync()->error("[Downloader] Could not move {} into place: {}", destination.string(), ec.message());
            return Failed{ec.message()};
        }

        if (destination != requested)
            Registry::sync()->info("[Downloader] {} already taken, saved as {}",
                                   requested.filename().string(), destination.filename().string());
        Registry::sync()->debug("[Downloader] Saved {} ({})", destination.string(), digest);
        return Saved{destination, std::move(digest)};
    } catch (const std::exception& e) {
        if (created) discard(tmp);
        Registry::sync()->error("[Downloader] {} failed: {}", url, e.what());
        return Failed{e.what()};
    }
}
