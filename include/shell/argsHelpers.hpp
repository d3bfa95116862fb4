#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ts::shell {

CommandResult ok(std::string out);
CommandResult fail(std::string msg);
CommandResult invalid(std::string msg);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

}
