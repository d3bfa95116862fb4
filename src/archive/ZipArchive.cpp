#include "archive/ZipArchive.hpp"

#include <stdexcept>
#include <zip.h>
#include <fmt/format.h>

using namespace ts::archive;

namespace {

std::string zipErrorString(const int code) {
    zip_error_t err;
    zip_error_init_with_code(&err, code);
    std::string msg = zip_error_strerror(&err);
    zip_error_fini(&err);
    return msg;
}

class ZipEntryStream final : public EntryStream {
public:
    ZipEntryStream(zip_t* za, const zip_uint64_t index, std::string name)
        : file_(zip_fopen_index(za, index, 0)), name_(std::move(name)) {
        if (!file_)
            throw std::runtime_error(fmt::format("Failed to open archive entry '{}': {}", name_,
                                                 zip_error_strerror(zip_get_error(za))));
    }

    ~ZipEntryStream() override { if (file_) zip_fclose(file_); }

    ZipEntryStream(const ZipEntryStream&) = delete;
    ZipEntryStream& operator=(const ZipEntryStream&) = delete;

    std::size_t read(char* buf, const std::size_t len) override {
        const zip_int64_t n = zip_fread(file_, buf, len);
        if (n < 0)
            throw std::runtime_error(fmt::format("Failed to read archive entry '{}': {}", name_,
                                                 zip_error_strerror(zip_file_get_error(file_))));
        return static_cast<std::size_t>(n);
    }

private:
    zip_file_t* file_;
    std::string name_;
};

}

ZipArchive::ZipArchive(const std::filesystem::path& path) : path_(path) {
    int errorCode = 0;
    za_ = zip_open(path.c_str(), ZIP_RDONLY, &errorCode);
    if (!za_)
        throw std::runtime_error(fmt::format("Failed to open zip archive {}: {}", path.string(),
                                             zipErrorString(errorCode)));
}

ZipArchive::~ZipArchive() {
    if (za_) zip_discard(za_);
}

std::unique_ptr<Reader> ZipArchive::open(const std::filesystem::path& path) {
    return std::make_unique<ZipArchive>(path);
}

std::vector<ArchiveEntry> ZipArchive::entries() {
    const zip_int64_t count = zip_get_num_entries(za_, 0);
    if (count < 0) throw std::runtime_error(fmt::format("Failed to enumerate {}", path_.string()));

    std::vector<ArchiveEntry> out;
    out.reserve(static_cast<size_t>(count));

    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(count); ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(za_, i, 0, &st) != 0 || !(st.valid & ZIP_STAT_NAME))
            throw std::runtime_error(fmt::format("Failed to stat entry {} of {}: {}", i, path_.string(),
                                                 zip_error_strerror(zip_get_error(za_))));

        ArchiveEntry entry;
        entry.relativePath = st.name;
        entry.isDirectory = !entry.relativePath.empty() && entry.relativePath.back() == '/';
        if (!entry.isDirectory) {
            zip_t* za = za_;
            entry.open = [za, i, name = entry.relativePath]() -> std::unique_ptr<EntryStream> {
                return std::make_unique<ZipEntryStream>(za, i, name);
            };
        }
        out.push_back(std::move(entry));
    }

    return out;
}
