/*
 * Shell quoting implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/quote/quote.hpp>
#include <cctype>
#include <cstring>

namespace shellgen {

static bool is_safe_char(char c) {
    if (c == '\0') return false;
    return std::isalnum(static_cast<unsigned char>(c)) || std::strchr("_-./:,+@%", c) != nullptr;
}

Quoted quote(const std::string& text) {
    if (text.empty()) return Quoted("''");
    bool safe = true;
    for (char c : text) if (!is_safe_char(c)) { safe = false; break; }
    if (safe) return Quoted(text);
    std::string out; out.reserve(text.size() + 2);
    out.push_back('\'');
    for (char c : text) {
        if (c == '\'') out += "'\"'\"'";
        else out.push_back(c);
    }
    out.push_back('\'');
    return Quoted(std::move(out));
}

Quoted glob(const std::string& text) {
    std::string out; out.reserve(text.size() * 2);
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) || (c != '\0' && std::strchr("*?[!-:]\\", c) != nullptr)) {
            out.push_back(c);
        } else if (c == '\n') {
            // a backslash-newline would be a line continuation
            out += "'\n'";
        } else {
            out.push_back('\\');
            out.push_back(c);
        }
    }
    return Quoted(std::move(out));
}

Quoted escape_double_quoted(const std::string& text) {
    std::string out; out.reserve(text.size());
    for (char c : text) {
        if (c == '$' || c == '`' || c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return Quoted(std::move(out));
}

} // namespace shellgen
