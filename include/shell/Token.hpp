#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace shrine::shell {

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
    if (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// One argv element -> tokens. "--key=value" splits, "-k" is a short flag, "-"
// and negative numbers stay words.
inline void tokenizeAtom(std::vector<Token>& out, const std::string& atom) {
    if (atom == "--") { pushWord(out, atom); return; }
    if (atom.size() < 2 || atom[0] != '-' || looks_negative_number(atom)) { pushWord(out, atom); return; }

    if (atom.rfind("--", 0) == 0) {
        const auto eq = atom.find('=');
        if (eq == std::string::npos) {
            pushFlag(out, atom.substr(2));
        } else {
            pushFlag(out, atom.substr(2, eq - 2));
            pushWord(out, atom.substr(eq + 1));
        }
        return;
    }

    if (atom.size() == 2) { pushFlag(out, atom.substr(1)); return; }

    // "-kVALUE" or "-k=VALUE": short flag with a glued value
    pushFlag(out, std::string(1, atom[1]));
    std::string value = atom.substr(2);
    if (!value.empty() && value[0] == '=') value.erase(value.begin());
    pushWord(out, std::move(value));
}

inline std::vector<Token> tokenizeArgs(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 2);
    bool afterSentinel = false;
    for (const auto& a : args) {
        if (afterSentinel) { pushWord(out, a); continue; }
        tokenizeAtom(out, a);
        if (a == "--") afterSentinel = true;
    }
    return out;
}

}
