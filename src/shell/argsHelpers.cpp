#include "shell/argsHelpers.hpp"

namespace ts::shell {

CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult fail(std::string msg) { return {1, "", std::move(msg)}; }
CommandResult invalid(std::string msg) { return {2, "", std::move(msg)}; }

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (hasFlag(c, k)) return true;
    return false;
}

}
