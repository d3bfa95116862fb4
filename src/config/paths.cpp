#include "config/paths.hpp"

#include <cstdlib>

namespace ts::paths {

namespace {
std::filesystem::path configOverride_;

std::filesystem::path home() {
    if (const char* h = std::getenv("HOME"); h && *h) return h;
    return std::filesystem::temp_directory_path();
}
}

std::filesystem::path expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() == 1) return home();
    if (path[1] != '/') return path;
    return home() / path.substr(2);
}

std::filesystem::path getConfigPath() {
    if (!configOverride_.empty()) return configOverride_;
    if (const char* env = std::getenv("TICKETSYNC_CONFIG"); env && *env) return expandHome(env);
    return home() / ".config" / "ticketsync" / "config.yaml";
}

void setConfigPath(const std::filesystem::path& path) { configOverride_ = path; }

std::filesystem::path defaultDownloadsDir() { return home() / "Downloads"; }

std::filesystem::path defaultStateFile() { return home() / ".local" / "share" / "ticketsync" / "workspace.json"; }

std::filesystem::path defaultLogDir() { return home() / ".local" / "share" / "ticketsync" / "logs"; }

std::filesystem::path ticketsRoot(const std::filesystem::path& downloadsDir) { return downloadsDir / "tickets"; }

}
