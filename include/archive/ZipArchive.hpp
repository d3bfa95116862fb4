#pragma once

#include "archive/Reader.hpp"

#include <filesystem>
#include <memory>

struct zip;

namespace ts::archive {

class ZipArchive final : public Reader {
public:
    // Throws std::runtime_error when the file is missing or not a zip archive.
    explicit ZipArchive(const std::filesystem::path& path);
    ~ZipArchive() override;

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    [[nodiscard]] std::vector<ArchiveEntry> entries() override;

    static std::unique_ptr<Reader> open(const std::filesystem::path& path);

private:
    zip* za_ = nullptr;
    std::filesystem::path path_;
};

}
