#pragma once

#include "config/paths.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ts::config {

constexpr static unsigned int DEFAULT_STATUS_BATCH_SIZE = 100;

struct ZendeskConfig {
    std::string subdomain;
    std::string email;
    std::string api_token;
    unsigned int timeout_seconds = 0; // 0 = leave it to libcurl

    [[nodiscard]] bool hasCredentials() const { return !subdomain.empty() && !email.empty() && !api_token.empty(); }
};

struct StorageConfig {
    std::filesystem::path downloads_dir = paths::defaultDownloadsDir();
    std::filesystem::path state_file = paths::defaultStateFile();

    [[nodiscard]] std::filesystem::path ticketsRoot() const { return paths::ticketsRoot(downloads_dir); }
};

struct SyncConfig {
    std::string archive_extension = ".zip";
    std::vector<std::string> closed_statuses = {"solved", "closed"};
    unsigned int status_batch_size = DEFAULT_STATUS_BATCH_SIZE;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ticketsync = spdlog::level::info;   // Startup, command outcomes
    spdlog::level::level_enum http       = spdlog::level::warn;   // Transport failures, non-2xx
    spdlog::level::level_enum ticketing  = spdlog::level::info;   // Remote lookups and empty results
    spdlog::level::level_enum crypto     = spdlog::level::warn;   // Digest and file-hash failures
    spdlog::level::level_enum archive    = spdlog::level::info;   // Expansion results, corrupt archives
    spdlog::level::level_enum index      = spdlog::level::info;   // Added/removed tickets, persistence
    spdlog::level::level_enum sync       = spdlog::level::info;   // Saved/duplicate/failed attachments
    spdlog::level::level_enum shell      = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = paths::defaultLogDir();
    LogLevelsConfig levels;
};

struct Config {
    ZendeskConfig zendesk;
    StorageConfig storage;
    SyncConfig sync;
    LoggingConfig logging;
};

// Missing file -> defaults. Credentials from the environment win over the file.
Config loadConfig(const std::filesystem::path& path);
void applyEnvironment(Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const ZendeskConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace ts::config
