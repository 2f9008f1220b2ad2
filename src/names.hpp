#pragma once
#include <cstddef>
#include <string_view>

namespace partbuf
{

constexpr std::size_t MAX_NAME_LENGTH = 255;

// Names that would collide with partition fields or accessor names.
bool is_forbidden_name(std::string_view name);

// Matches ^(?![0-9])[A-Za-z0-9$_]+$ (no length limit).
bool matches_name_pattern(std::string_view name);

// A valid partition or property name, once surrounding whitespace is trimmed:
// 1..255 characters, matches the name pattern, and is not forbidden.
bool is_valid_name(std::string_view name);

std::string_view trim(std::string_view s);

} // namespace partbuf
