#pragma once

#include "archive/Reader.hpp"

#include <filesystem>
#include <string>
#include <variant>

namespace ts::archive {

struct Extracted {
    std::filesystem::path folder;
};

struct Failed {
    std::string cause;
};

using ExpandResult = std::variant<Extracted, Failed>;

class Expander {
public:
    explicit Expander(ReaderFactory factory, std::string extension = ".zip");

    // Case-insensitive match on the configured container extension.
    [[nodiscard]] bool isArchive(const std::filesystem::path& path) const;

    // Extracts into a fresh folder under destinationFolder and deletes the archive on success.
    // Never overwrites an existing folder. Partial output is left behind on failure.
    [[nodiscard]] ExpandResult expand(const std::filesystem::path& archivePath,
                                      const std::filesystem::path& destinationFolder) const;

    // "name", then "name(1)", "name(2)", ... until nothing exists at that path.
    static std::filesystem::path uniqueFolder(const std::filesystem::path& parent, const std::string& name);

private:
    ReaderFactory factory_;
    std::string extension_;
};

}
