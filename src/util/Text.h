#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace text_util {

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) b++;
  size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  return s.substr(b, e - b);
}

// An empty needle never matches.
inline bool contains_ci(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return false;
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

inline bool equals_ci(const std::string& a, const std::string& b) {
  return to_lower(a) == to_lower(b);
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} 
