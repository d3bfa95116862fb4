#include "ticketing/fileNames.hpp"

#include <filesystem>
#include <unordered_map>
#include <unordered_set>
#include <fmt/format.h>

namespace ts::ticketing {

std::string sanitizeFileName(const std::string& name) {
    std::string base = name;
    if (const auto slash = base.find_last_of("/\\"); slash != std::string::npos) base = base.substr(slash + 1);

    std::string out;
    out.reserve(base.size());
    for (const char c : base)
        out.push_back(static_cast<unsigned char>(c) < 0x20 || c == ':' ? '_' : c);

    if (out.empty() || out == "." || out == "..") return "attachment";
    return out;
}

void disambiguateFileNames(std::vector<std::string>& names) {
    std::unordered_map<std::string, unsigned int> seen;
    std::unordered_set<std::string> used(names.begin(), names.end());

    for (auto& name : names) {
        const auto count = ++seen[name];
        if (count == 1) continue;

        const std::filesystem::path p(name);
        const auto stem = p.stem().string();
        const auto ext = p.extension().string();

        auto n = count;
        std::string candidate = fmt::format("{}({}){}", stem, n, ext);
        while (used.contains(candidate)) candidate = fmt::format("{}({}){}", stem, ++n, ext);

        used.insert(candidate);
        name = std::move(candidate);
    }
}

}
