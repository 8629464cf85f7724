#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace scout::util {

std::string ToLower(std::string_view value);
std::string Trim(std::string_view value);

// Case-insensitive substring test. An empty needle never matches.
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

// True if any fragment is a case-insensitive substring of value.
bool ContainsAnyIgnoreCase(std::string_view value, const std::vector<std::string>& fragments);

bool EqualsIgnoreCase(std::string_view a, std::string_view b);
bool StartsWith(std::string_view value, std::string_view prefix);

std::vector<std::string> Split(std::string_view value, char delimiter);

} // namespace scout::util
