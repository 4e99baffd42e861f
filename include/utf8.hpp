#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace reviewer {

// Cuts at most `length` bytes without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

bool is_valid_utf8(const std::string& str);

// Replaces every byte that is not part of a well-formed UTF-8 sequence with U+FFFD.
std::string to_valid_utf8(const std::string& str);

// Applies to_valid_utf8 to every string and object key inside `j`.
void make_valid_utf8(nlohmann::json& j);

} // namespace reviewer
