#include "strings.hpp"

#include <algorithm>
#include <cctype>

namespace scout::util {

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Trim(std::string_view value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return std::string(value.substr(first, last - first + 1));
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty() || needle.size() > haystack.size()) {
    return false;
  }
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

bool ContainsAnyIgnoreCase(std::string_view value, const std::vector<std::string>& fragments) {
  const auto lowered = ToLower(value);
  for (const auto& fragment : fragments) {
    if (!fragment.empty() && lowered.find(ToLower(fragment)) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

std::vector<std::string> Split(std::string_view value, char delimiter) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (start <= value.size()) {
    const auto end = value.find(delimiter, start);
    if (end == std::string_view::npos) {
      parts.emplace_back(value.substr(start));
      break;
    }
    parts.emplace_back(value.substr(start, end - start));
    start = end + 1;
  }
  return parts;
}

} // namespace scout::util
