// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cartograph {
namespace util {

std::string ToLower(std::string_view text);

// Strip leading/trailing ASCII whitespace
std::string Trim(std::string_view text);

// Split on a delimiter, trimming each piece and dropping empty pieces.
// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> SplitAndTrim(std::string_view text, char delimiter = ',');

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);
bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix);
bool EndsWithIgnoreCase(std::string_view text, std::string_view suffix);

// Parse a base-10 integer in [min, max]. Rejects empty strings, trailing
// garbage and out-of-range values instead of throwing like std::stoi.
std::optional<int64_t> SafeParseInt(std::string_view text, int64_t min, int64_t max);

}  // namespace util
}  // namespace cartograph
