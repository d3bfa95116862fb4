#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ts::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success, 1 = operation failed, 2 = usage error
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandUsage {
    std::string name;
    std::string synopsis;                    // e.g. "remove <ticketId>..."
    std::string description;
    std::vector<std::string> aliases;
};

struct CommandInfo {
    CommandUsage usage;
    CommandHandler handler;
};

}
