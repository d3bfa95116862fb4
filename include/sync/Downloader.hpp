#pragma once

#include "http/Transport.hpp"
#include "sync/HashSet.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <variant>

namespace ts::sync {

struct Saved {
    std::filesystem::path path;
    std::string hash;
};

struct Duplicate {
    std::string hash;
};

struct Failed {
    std::string cause;
};

using DownloadResult = std::variant<Saved, Duplicate, Failed>;

class Downloader {
public:
    explicit Downloader(std::shared_ptr<http::Transport> transport);

    // Streams url into "<destination>.temp" while hashing it. A digest already in knownHashes
    // discards the file; otherwise the digest is claimed and the temp file renamed into place.
    // Existing files are never overwritten: a taken name becomes "stem(n).ext" and Saved::path
    // holds the name actually used. The temp file never survives a non-Saved result.
    [[nodiscard]] DownloadResult download(const std::string& url, const std::filesystem::path& destination,
                                          HashSet& knownHashes) const;

    static std::filesystem::path tempPathFor(const std::filesystem::path& destination);

    // First of destination, "stem(1).ext", "stem(2).ext"... where neither the name nor its temp exists.
    static std::filesystem::path freeDestination(const std::filesystem::path& destination);

private:
    std::shared_ptr<http::Transport> transport_;
};

}
