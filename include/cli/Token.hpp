#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bk::cli {

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

// argv is already split by the shell; this only classifies each argument.
// "--key=value" becomes Flag(key) Word(value), "-h" becomes Flag(h), "--" stays a Word sentinel.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    for (const auto& a : args) {
        if (a == "--" || a == "-" || looks_negative_number(a) || a.empty() || a[0] != '-') {
            pushWord(out, a);
            continue;
        }

        if (a.rfind("--", 0) == 0) {
            const auto eq = a.find('=');
            if (eq == std::string::npos) {
                pushFlag(out, a.substr(2));
            } else {
                pushFlag(out, a.substr(2, eq - 2));
                pushWord(out, a.substr(eq + 1));
            }
            continue;
        }

        // short flag, "-c=4" and "-c4" both carry a glued value
        pushFlag(out, a.substr(1, 1));
        if (a.size() > 2) {
            std::string value = a.substr(2);
            if (value[0] == '=') value.erase(value.begin());
            pushWord(out, std::move(value));
        }
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
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
