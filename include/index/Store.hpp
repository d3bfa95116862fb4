#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace ts::index {

// The persisted state could not be written. Memory and disk still agree on the previous value.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual std::optional<nlohmann::json> get(const std::string& key) const = 0;

    // Durable once this returns. Throws PersistenceError otherwise.
    virtual void set(const std::string& key, nlohmann::json value) = 0;
};

}
