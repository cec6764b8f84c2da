#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace gitsync::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    out.push_back({TokenType::Flag, std::move(k)});
}
inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// Expand short bundle "-abc" -> flags a,b,c
inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// Classifies argv (already split by the invoking shell) into words and flags.
// The first argument is always a word so "--help" and "--version" can name a command.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 2);

    bool sentinel = false;
    for (const auto& arg : args) {
        if (sentinel || out.empty() || arg.size() < 2 || arg[0] != '-' || looks_negative_number(arg)) {
            pushWord(out, arg);
            continue;
        }

        // Sentinel "--" passes through as a word; the parser stops reading flags there
        if (arg == "--") {
            pushWord(out, arg);
            sentinel = true;
            continue;
        }

        // Long flag forms: --key or --key=value
        if (arg.rfind("--", 0) == 0) {
            const auto eq = arg.find('=');
            if (eq == std::string::npos) pushFlag(out, arg.substr(2));
            else {
                pushFlag(out, arg.substr(2, eq - 2));
                pushWord(out, arg.substr(eq + 1));
            }
            continue;
        }

        // "-k" or bundle "-abc"
        if (arg.size() == 2) pushFlag(out, arg.substr(1));
        else expand_bundle(std::string_view(arg).substr(1), out);
    }

    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

inline std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    out.reserve(64 + tokens.size() * 16);
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
