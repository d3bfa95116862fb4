#pragma once

#include "shell/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace ts::shell {

class Router {
public:
    void registerCommand(CommandUsage usage, CommandHandler handler);

    // args excludes the program name
    CommandResult execute(const std::vector<std::string>& args) const;

    [[nodiscard]] std::string renderHelp() const;
    [[nodiscard]] bool hasCommand(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::vector<std::string> order_;

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string normalize_alias(const std::string& s);
    static std::string strip_leading_dashes(const std::string& s);
};

}
