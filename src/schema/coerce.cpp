#include "agentval/schema/coerce.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace agentval::schema
{
namespace
{

std::string trim(const std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (begin >= end)
        return {};
    return std::string(begin, end);
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool matches_primitive(const Json& value, TypeKind target)
{
    switch (target)
    {
    case TypeKind::String:
        return value.is_string();
    case TypeKind::Integer:
        return value.is_number_integer();
    case TypeKind::Float:
        return value.is_number_float();
    case TypeKind::Boolean:
        return value.is_boolean();
    default:
        return false;
    }
}

std::optional<int64_t> parse_integer(const std::string& text)
{
    auto s = trim(text);
    if (s.empty())
        return std::nullopt;
    size_t digits_from = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (digits_from == s.size())
        return std::nullopt;
    if (!std::all_of(s.begin() + static_cast<long>(digits_from), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }))
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end != s.c_str() + s.size())
        return std::nullopt;
    return static_cast<int64_t>(v);
}

std::optional<double> parse_float(const std::string& text)
{
    auto s = trim(text);
    if (s.empty())
        return std::nullopt;
    // strtod also takes hex floats and inf/nan spellings; only decimal literals qualify.
    bool decimal = std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0 || c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E';
    });
    if (!decimal)
        return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(v))
        return std::nullopt;
    return v;
}

std::optional<bool> parse_boolean(const std::string& text)
{
    auto s = lower(trim(text));
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return std::nullopt;
}

std::optional<Json> coerce(const Json& raw, TypeKind target)
{
    if (matches_primitive(raw, target))
        return raw;

    switch (target)
    {
    case TypeKind::Integer:
        if (raw.is_string())
            if (auto v = parse_integer(raw.get_ref<const std::string&>()))
                return Json(*v);
        return std::nullopt;
    case TypeKind::Float:
        if (raw.is_number_integer())
            return Json(raw.get<double>());
        if (raw.is_string())
            if (auto v = parse_float(raw.get_ref<const std::string&>()))
                return Json(*v);
        return std::nullopt;
    case TypeKind::Boolean:
        if (raw.is_string())
            if (auto v = parse_boolean(raw.get_ref<const std::string&>()))
                return Json(*v);
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

} // namespace agentval::schema
