#include "shell/Router.hpp"
#include "shell/Parser.hpp"
#include "shell/argsHelpers.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

using namespace ts::shell;
using namespace ts::log;

void Router::registerCommand(CommandUsage usage, CommandHandler handler) {
    const std::string key = normalize(usage.name);

    for (const auto& alias : usage.aliases) {
        const auto a = normalize_alias(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            Registry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                    a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
        Registry::shell()->debug("Alias '{}' mapped to '{}'", a, key);
    }

    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = CommandInfo{std::move(usage), std::move(handler)};
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize_alias(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::hasCommand(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    const auto call = parseTokens(tokenize(args));

    if (call.name.empty()) return {2, renderHelp(), "No command provided."};
    const auto canonical = canonicalFor(call.name);

    if (!commands_.contains(canonical))
        return {2, renderHelp(), fmt::format("Unknown command: {}", call.name)};

    Registry::shell()->debug("[Router] Executing command: '{}'", canonical);

    try {
        return commands_.at(canonical).handler(call);
    } catch (const std::exception& e) {
        Registry::shell()->error("[Router] Command '{}' failed: {}", canonical, e.what());
        return fail(fmt::format("{} failed: {}", canonical, e.what()));
    }
}

std::string Router::renderHelp() const {
    size_t width = 0;
    for (const auto& name : order_) width = std::max(width, commands_.at(name).usage.synopsis.size());

    std::string out = "Usage: ticketsync [--config <path>] <command> [args]\n\nCommands:\n";
    for (const auto& name : order_) {
        const auto& u = commands_.at(name).usage;
        out += fmt::format("  {:<{}}  {}\n", u.synopsis, width, u.description);
    }
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::strip_leading_dashes(const std::string& s) {
    size_t i = 0; while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

std::string Router::normalize_alias(const std::string& s) {
    return normalize(strip_leading_dashes(s));
}
