#pragma once

#include "protocols/shell/Token.hpp"
#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace gitsync::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// First word names the command. A flag takes the following word as its value unless it is
// one of the command's switches.
inline CommandCall parseTokens(const std::vector<Token>& toks,
                               const std::unordered_set<std::string>& switches = {}) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;

    // 1) Command name = first Word
    for (; i < toks.size(); ++i) {
        if (toks[i].type == TokenType::Word) {
            call.name = toks[i].text;
            ++i;
            break;
        }
    }

    bool stop_flags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto& key = t.text;
            if (!switches.contains(key) && i + 1 < toks.size() && toks[i+1].type == TokenType::Word
                && toks[i+1].text != "--") {
                setOpt(call, key, toks[i+1].text);
                ++i; // consumed value
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
