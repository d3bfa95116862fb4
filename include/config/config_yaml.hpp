#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ts::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = ts::paths::expandHome(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<ZendeskConfig> {
    static Node encode(const ZendeskConfig& rhs) {
        Node node;
        node["subdomain"] = rhs.subdomain;
        node["email"] = rhs.email;
        node["api_token"] = rhs.api_token;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, ZendeskConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.subdomain = node["subdomain"].as<std::string>("");
        rhs.email = node["email"].as<std::string>("");
        rhs.api_token = node["api_token"].as<std::string>("");
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(0);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["downloads_dir"] = rhs.downloads_dir;
        node["state_file"] = rhs.state_file;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.downloads_dir = node["downloads_dir"].as<std::filesystem::path>(ts::paths::defaultDownloadsDir());
        rhs.state_file = node["state_file"].as<std::filesystem::path>(ts::paths::defaultStateFile());
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["archive_extension"] = rhs.archive_extension;
        node["closed_statuses"] = rhs.closed_statuses;
        node["status_batch_size"] = rhs.status_batch_size;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.archive_extension = node["archive_extension"].as<std::string>(".zip");
        if (node["closed_statuses"]) rhs.closed_statuses = node["closed_statuses"].as<std::vector<std::string>>();
        rhs.status_batch_size = node["status_batch_size"].as<unsigned int>(DEFAULT_STATUS_BATCH_SIZE);
        if (rhs.status_batch_size == 0) throw std::invalid_argument("sync.status_batch_size must be greater than zero");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["ticketsync"] = to_std_string(spdlog::level::to_string_view(rhs.ticketsync));
        node["http"]       = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["ticketing"]  = to_std_string(spdlog::level::to_string_view(rhs.ticketing));
        node["crypto"]     = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["archive"]    = to_std_string(spdlog::level::to_string_view(rhs.archive));
        node["index"]      = to_std_string(spdlog::level::to_string_view(rhs.index));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["shell"]      = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ticketsync = spdlog::level::from_str(node["ticketsync"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.ticketing = spdlog::level::from_str(node["ticketing"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.archive = spdlog::level::from_str(node["archive"].as<std::string>("info"));
        rhs.index = spdlog::level::from_str(node["index"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::filesystem::path>(ts::paths::defaultLogDir());
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
