#include "names.hpp"

#include <algorithm>
#include <array>

namespace partbuf
{

namespace
{

constexpr std::array<std::string_view, 21> FORBIDDEN_NAMES{
    // partition fields
    "isTag", "maxEntities", "name", "schema", "size",
    // sparse accessors
    "deleteProperty", "get", "set",
    // object prototype members
    "__defineGetter__", "__defineSetter__", "__lookupGetter__", "__lookupSetter__",
    "__proto__", "constructor", "hasOwnProperty", "isPrototypeOf",
    "propertyIsEnumerable", "prototype", "toLocaleString", "toString", "valueOf"};

constexpr bool is_ascii_alpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }

constexpr bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

bool is_forbidden_name(std::string_view name)
{
    return std::find(FORBIDDEN_NAMES.begin(), FORBIDDEN_NAMES.end(), name) != FORBIDDEN_NAMES.end();
}

bool matches_name_pattern(std::string_view name)
{
    if (name.empty() || is_ascii_digit(name.front()))
        return false;
    return std::all_of(name.begin(), name.end(), [](char c)
                       { return is_ascii_alpha(c) || is_ascii_digit(c) || c == '_' || c == '$'; });
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return s;
}

bool is_valid_name(std::string_view name)
{
    std::string_view t = trim(name);
    return !t.empty() && t.size() <= MAX_NAME_LENGTH && !is_forbidden_name(t) &&
           matches_name_pattern(t);
}

} // namespace partbuf
