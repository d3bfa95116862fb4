#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ts::config {

namespace {
std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

template <typename T> void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::invalid_argument("Invalid config section '" + key + "': expected a mapping");
}
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    if (std::filesystem::exists(path)) {
        const YAML::Node root = YAML::LoadFile(path.string());

        decodeSection(root, "zendesk", cfg.zendesk);
        decodeSection(root, "storage", cfg.storage);
        decodeSection(root, "sync", cfg.sync);
        decodeSection(root, "logging", cfg.logging);
    }

    applyEnvironment(cfg);
    return cfg;
}

void applyEnvironment(Config& cfg) {
    const auto apply = [](const char* name, std::string& target) {
        if (const char* v = std::getenv(name); v && *v) target = v;
    };

    apply("ZENDESK_SUBDOMAIN", cfg.zendesk.subdomain);
    apply("ZENDESK_EMAIL", cfg.zendesk.email);
    apply("ZENDESK_API_TOKEN", cfg.zendesk.api_token);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"zendesk", c.zendesk},
        {"storage", c.storage},
        {"sync", c.sync},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const ZendeskConfig& c) {
    j = {
        {"subdomain", c.subdomain},
        {"email", c.email},
        {"api_token", c.api_token.empty() ? "" : "********"},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"downloads_dir", c.downloads_dir.string()},
        {"tickets_root", c.ticketsRoot().string()},
        {"state_file", c.state_file.string()}
    };
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"archive_extension", c.archive_extension},
        {"closed_statuses", c.closed_statuses},
        {"status_batch_size", c.status_batch_size}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"ticketsync", levelName(c.ticketsync)},
        {"http", levelName(c.http)},
        {"ticketing", levelName(c.ticketing)},
        {"crypto", levelName(c.crypto)},
        {"archive", levelName(c.archive)},
        {"index", levelName(c.index)},
        {"sync", levelName(c.sync)},
        {"shell", levelName(c.shell)}
    };
}

} // namespace ts::config
