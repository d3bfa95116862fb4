#include "fakes/zipBuilder.hpp"
#include "fakes/testDirs.hpp"

#include <stdexcept>
#include <zip.h>

namespace ts::test {

void writeZip(const std::filesystem::path& out, const ZipEntries& entries) {
    int err = 0;
    zip_t* za = zip_open(out.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!za) throw std::runtime_error("zip_open failed for " + out.string());

    for (const auto& [name, content] : entries) {
        if (!name.empty() && name.back() == '/') {
            if (zip_dir_add(za, name.c_str(), ZIP_FL_ENC_UTF_8) < 0) {
                zip_discard(za);
                throw std::runtime_error("zip_dir_add failed for " + name);
            }
            continue;
        }

        zip_source_t* src = zip_source_buffer(za, content.data(), content.size(), 0);
        if (!src || zip_file_add(za, name.c_str(), src, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
            if (src) zip_source_free(src);
            zip_discard(za);
            throw std::runtime_error("zip_file_add failed for " + name);
        }
    }

    if (zip_close(za) != 0) {
        zip_discard(za);
        throw std::runtime_error("zip_close failed for " + out.string());
    }
}

std::string zipBytes(const std::filesystem::path& scratchDir, const ZipEntries& entries) {
    const auto path = scratchDir / "scratch.zip";
    writeZip(path, entries);
    auto bytes = readFile(path);
    std::filesystem::remove(path);
    return bytes;
}

}
