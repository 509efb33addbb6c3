#include "str.hh"

#include <algorithm>
#include <cctype>

namespace chacha {

void StripLeadingWhitespace(Str &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                  [](unsigned char ch) { return !std::isspace(ch); }));
}

void StripTrailingWhitespace(Str &s) {
  while (!s.empty() and std::isspace((unsigned char)s.back())) {
    s.pop_back();
  }
}

void StripWhitespace(Str &s) {
  StripLeadingWhitespace(s);
  StripTrailingWhitespace(s);
}

} // namespace chacha
