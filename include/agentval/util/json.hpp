#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentval::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}

/// Parse without throwing; nullopt when the text is not a JSON document.
inline std::optional<json> try_parse(const std::string& s)
{
    auto j = json::parse(s, nullptr, false);
    if (j.is_discarded())
        return std::nullopt;
    return j;
}

/// Compact serialization; invalid UTF-8 is replaced rather than thrown on.
inline std::string dump(const json& j)
{
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

/// Cut `s` to at most `max_bytes` without splitting a UTF-8 sequence.
inline std::string truncate_utf8(const std::string& s, size_t max_bytes)
{
    if (s.size() <= max_bytes)
        return s;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80)
        --cut;
    return s.substr(0, cut);
}

} // namespace agentval::util::json
