#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ts::archive {

// Sequential byte source for one archive member.
class EntryStream {
public:
    virtual ~EntryStream() = default;

    // Returns bytes read, 0 at end. Throws std::runtime_error on a read error.
    virtual std::size_t read(char* buf, std::size_t len) = 0;
};

struct ArchiveEntry {
    std::string relativePath;   // '/'-separated, as stored in the archive
    bool isDirectory = false;
    std::function<std::unique_ptr<EntryStream>()> open;
};

class Reader {
public:
    virtual ~Reader() = default;

    // Enumerates every entry. Streams handed out by ArchiveEntry::open are only valid while the reader lives.
    [[nodiscard]] virtual std::vector<ArchiveEntry> entries() = 0;
};

// Opens an archive on disk; throws std::runtime_error if it is unreadable.
using ReaderFactory = std::function<std::unique_ptr<Reader>(const std::filesystem::path&)>;

}
