#pragma once

#include "index/Store.hpp"

#include <filesystem>
#include <mutex>

namespace ts::index {

// One JSON object on disk, loaded at construction and rewritten on every set.
class JsonFileStore final : public Store {
public:
    // An absent file starts empty. Throws std::runtime_error if the file exists but is not a JSON object.
    explicit JsonFileStore(std::filesystem::path path);

    [[nodiscard]] std::optional<nlohmann::json> get(const std::string& key) const override;
    void set(const std::string& key, nlohmann::json value) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    nlohmann::json data_ = nlohmann::json::object();
    mutable std::mutex mutex_;

    void flush(const nlohmann::json& doc) const;
};

}
