#pragma once

#include <filesystem>
#include <string>

namespace ts::paths {

// Expands a leading "~" from $HOME. Other paths are returned unchanged.
std::filesystem::path expandHome(const std::string& path);

std::filesystem::path getConfigPath();

void setConfigPath(const std::filesystem::path& path);

std::filesystem::path defaultDownloadsDir();
std::filesystem::path defaultStateFile();
std::filesystem::path defaultLogDir();

// <downloads_dir>/tickets
std::filesystem::path ticketsRoot(const std::filesystem::path& downloadsDir);

}
