#include "archive/Expander.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <set>
#include <stdexcept>
#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>

using namespace ts::archive;
using namespace ts::log;
namespace fs = std::filesystem;

namespace {

using Segments = std::vector<std::string>;

struct PlannedEntry {
    Segments segments;
    const ArchiveEntry* entry;
};

Segments splitEntryPath(const std::string& path) {
    if (path.empty()) return {};
    if (path.front() == '/' || path.front() == '\\')
        throw std::runtime_error(fmt::format("absolute entry path '{}'", path));

    Segments out;
    size_t start = 0;
    while (start <= path.size()) {
        const auto end = path.find('/', start);
        const auto seg = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (seg == "..") throw std::runtime_error(fmt::format("entry '{}' escapes the archive root", path));
        if (!seg.empty() && seg != ".") out.push_back(seg);
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return out;
}

fs::path joinSegments(const Segments& segs, const size_t from) {
    fs::path p;
    for (size_t i = from; i < segs.size(); ++i) p /= segs[i];
    return p;
}

void copyEntry(const ArchiveEntry& entry, const fs::path& target) {
    if (!entry.open) throw std::runtime_error(fmt::format("entry '{}' cannot be opened", entry.relativePath));

    const auto in = entry.open();
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error(fmt::format("cannot create {}", target.string()));

    std::array<char, 8192> buf{};
    while (const auto n = in->read(buf.data(), buf.size())) {
        out.write(buf.data(), static_cast<std::streamsize>(n));
        if (!out) throw std::runtime_error(fmt::format("write failed for {}", target.string()));
    }

    out.close();
    if (!out) throw std::runtime_error(fmt::format("close failed for {}", target.string()));
}

}

Expander::Expander(ReaderFactory factory, std::string extension)
    : factory_(std::move(factory)), extension_(std::move(extension)) {
    if (!factory_) throw std::invalid_argument("Expander requires a reader factory");
}

bool Expander::isArchive(const fs::path& path) const {
    return boost::algorithm::iequals(path.extension().string(), extension_);
}

fs::path Expander::uniqueFolder(const fs::path& parent, const std::string& name) {
    fs::path candidate = parent / name;
    for (unsigned int n = 1; fs::exists(candidate); ++n)
        candidate = parent / fmt::format("{}({})", name, n);
    return candidate;
}

ExpandResult Expander::expand(const fs::path& archivePath, const fs::path& destinationFolder) const {
    try {
        const auto reader = factory_(archivePath);
        const auto entries = reader->entries();

        // Validate every entry before touching the filesystem
        std::vector<PlannedEntry> plan;
        plan.reserve(entries.size());
        std::set<std::string> topLevel;
        for (const auto& e : entries) {
            auto segs = splitEntryPath(e.relativePath);
            if (segs.empty()) continue;
            topLevel.insert(segs.front());
            plan.push_back({std::move(segs), &e});
        }

        // Rooted only when everything lives beneath a single directory
        const bool rooted = topLevel.size() == 1 && std::ranges::all_of(plan, [](const PlannedEntry& p) {
            return p.segments.size() > 1 || p.entry->isDirectory;
        });

        const std::string folderName = rooted ? *topLevel.begin() : archivePath.stem().string();
        const auto root = uniqueFolder(destinationFolder, folderName);
        fs::create_directories(root);

        const size_t strip = rooted ? 1 : 0;
        for (const auto& p : plan) {
            const auto rel = joinSegments(p.segments, strip);
            if (rel.empty()) continue;

            const auto target = root / rel;
            if (p.entry->isDirectory) {
                fs::create_directories(target);
                continue;
            }

            fs::create_directories(target.parent_path());
            copyEntry(*p.entry, target);
        }

        std::error_code ec;
        fs::remove(archivePath, ec);
        if (ec) Registry::archive()->warn("[Expander] Extracted {} but could not delete it: {}",
                                          archivePath.string(), ec.message());

        Registry::archive()->info("[Expander] Extracted {} -> {}", archivePath.filename().string(), root.string());
        return Extracted{root};
    } catch (const std::exception& e) {
        Registry::archive()->error("[Expander] Failed to expand {}: {}", archivePath.string(), e.what());
        return Failed{e.what()};
    }
}
