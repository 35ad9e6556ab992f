#ifndef __TG_URL_UTILS__
#define __TG_URL_UTILS__

#include "Headers.hpp"

namespace tg {

// Parsed components of an HTTP request target such as /ws/terminal?session=a
struct ParsedTarget {
  string path;
  map<string, string> query;
};

inline int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Decodes %XX escapes and '+' (as space).  Malformed escapes are kept
// verbatim.
inline string percentDecode(const string& s) {
  string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    char c = s[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < s.size() && hexValue(s[i + 1]) >= 0 &&
               hexValue(s[i + 2]) >= 0) {
      out.push_back(char(hexValue(s[i + 1]) * 16 + hexValue(s[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

// Splits a request target into its path and query parameters.  When a
// parameter repeats, the first occurrence wins.  Fragments are dropped.
inline ParsedTarget parseTarget(const string& target) {
  ParsedTarget result;
  string remaining = target;
  size_t hashIndex = remaining.find('#');
  if (hashIndex != string::npos) {
    remaining = remaining.substr(0, hashIndex);
  }

  size_t queryIndex = remaining.find('?');
  if (queryIndex == string::npos) {
    result.path = remaining;
    return result;
  }
  result.path = remaining.substr(0, queryIndex);
  for (const auto& pair : split(remaining.substr(queryIndex + 1), '&')) {
    if (pair.empty()) {
      continue;
    }
    size_t equalsIndex = pair.find('=');
    string key, value;
    if (equalsIndex == string::npos) {
      key = percentDecode(pair);
    } else {
      key = percentDecode(pair.substr(0, equalsIndex));
      value = percentDecode(pair.substr(equalsIndex + 1));
    }
    result.query.insert(make_pair(key, value));
  }
  return result;
}

}  // namespace tg

#endif  // __TG_URL_UTILS__
