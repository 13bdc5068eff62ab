/*
 * Shell quoting - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Quoted text is text that can be spliced unescaped into generated shell
 *   source. quote() turns arbitrary text into a single shell word that
 *   expands back to the input; glob() escapes everything except the
 *   wildcard characters, for patterns.
 */
#pragma once
#include <sstream>
#include <string>
#include <utility>

namespace shellgen {

class Quoted {
public:
    Quoted() = default;
    explicit Quoted(std::string text) : m_text(std::move(text)) {}
    const std::string& text() const { return m_text; }
    bool empty() const { return m_text.empty(); }

    Quoted& operator+=(const Quoted& other) { m_text += other.m_text; return *this; }
private:
    std::string m_text;
};

inline Quoted operator+(Quoted a, const Quoted& b) { a += b; return a; }
inline bool operator==(const Quoted& a, const Quoted& b) { return a.text() == b.text(); }
inline bool operator!=(const Quoted& a, const Quoted& b) { return !(a == b); }

// Single shell word whose expansion is exactly `text`.
Quoted quote(const std::string& text);

// Escapes all characters that are neither alphanumeric nor one of *?[!-:]\ .
Quoted glob(const std::string& text);

// Text for use between double quotes, e.g. as the word of ${v:-word}:
// $ ` " and \ get a backslash, nothing is wrapped.
Quoted escape_double_quoted(const std::string& text);

// A value spliced through its stream representation, unquoted.
// Only meant for values whose text form is shell-safe (numbers).
template <typename T>
struct Val {
    T value;
};

template <typename T>
Val<T> val(T v) { return Val<T>{std::move(v)}; }

template <typename T>
std::string show(const Val<T>& v) {
    std::ostringstream oss; oss << v.value;
    return oss.str();
}

// Quoted form of a shown value, for initializing variables.
template <typename T>
Quoted quote(const Val<T>& v) { return quote(show(v)); }

} // namespace shellgen
