#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace ts::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// Flags listed in valueFlags consume the following word; every other flag is boolean.
inline CommandCall parseTokens(const std::vector<Token>& toks,
                               const std::unordered_set<std::string>& valueFlags = {"config", "c"}) {
    CommandCall call;
    call.options.reserve(4);
    call.positionals.reserve(8);

    size_t i = 0;
    bool stop_flags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            if (valueFlags.contains(t.text) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word) {
                setOpt(call, t.text, toks[i + 1].text);
                ++i;
            } else setOpt(call, t.text, std::nullopt);
            continue;
        }

        // First word names the command
        if (call.name.empty() && !stop_flags) {
            call.name = t.text;
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
