#include "index/JsonFileStore.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <fmt/format.h>

using namespace ts::index;
using namespace ts::log;
namespace fs = std::filesystem;

JsonFileStore::JsonFileStore(fs::path path) : path_(std::move(path)) {
    if (!fs::exists(path_)) {
        Registry::index()->debug("[JsonFileStore] No state at {}, starting empty", path_.string());
        return;
    }

    std::ifstream in(path_);
    if (!in) throw std::runtime_error(fmt::format("Cannot open state file {}", path_.string()));

    try {
        data_ = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("State file {} is corrupt: {}", path_.string(), e.what()));
    }

    if (!data_.is_object())
        throw std::runtime_error(fmt::format("State file {} does not hold a JSON object", path_.string()));
}

std::optional<nlohmann::json> JsonFileStore::get(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = data_.find(key); it != data_.end()) return *it;
    return std::nullopt;
}

void JsonFileStore::set(const std::string& key, nlohmann::json value) {
    std::scoped_lock lock(mutex_);
    auto next = data_;
    next[key] = std::move(value);
    flush(next);
    data_ = std::move(next);
}

void JsonFileStore::flush(const nlohmann::json& doc) const {
    auto tmp = path_;
    tmp += ".tmp";

    try {
        if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) throw std::runtime_error("cannot open " + tmp.string());
            out << doc.dump(2);
            out.close();
            if (!out) throw std::runtime_error("write failed for " + tmp.string());
        }

        fs::rename(tmp, path_);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        Registry::index()->error("[JsonFileStore] Failed to persist {}: {}", path_.string(), e.what());
        throw PersistenceError(fmt::format("Failed to persist {}: {}", path_.string(), e.what()));
    }
}
