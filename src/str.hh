#pragma once

#include <concepts>
#include <string>
#include <string_view>

namespace chacha {

using Str = std::string;
using StrView = std::string_view;

using namespace std::literals;

void StripLeadingWhitespace(Str &);
void StripTrailingWhitespace(Str &);
void StripWhitespace(Str &);

// ToStr function should be the default way of converting values to strings.
//
// It relies on ADL for lookup, so types declared in other namespaces can
// provide their own ToStr overloads next to their definitions.
inline Str ToStr(int val) { return std::to_string(val); }
inline Str ToStr(long val) { return std::to_string(val); }
inline Str ToStr(long long val) { return std::to_string(val); }
inline Str ToStr(unsigned val) { return std::to_string(val); }
inline Str ToStr(unsigned long val) { return std::to_string(val); }
inline Str ToStr(unsigned long long val) { return std::to_string(val); }
inline Str ToStr(double val) { return std::to_string(val); }

template <typename T>
  requires requires(T t) {
    { t.ToStr() } -> std::same_as<Str>;
  }
Str ToStr(const T &t) {
  return t.ToStr();
}

template <typename T>
concept Stringer = requires(T t) {
  { ToStr(t) } -> std::same_as<Str>;
};

} // namespace chacha
