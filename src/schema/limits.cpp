#include "agentval/schema/limits.hpp"

#include "agentval/schema/path.hpp"
#include "agentval/schema/schema.hpp"
#include "agentval/util/json.hpp"

namespace agentval::schema
{

Limits Limits::with_overrides(const SchemaLimits& overrides) const
{
    Limits out = *this;
    if (overrides.max_keys)
        out.max_dict_keys = *overrides.max_keys;
    if (overrides.max_list_len)
        out.max_list_len = *overrides.max_list_len;
    if (overrides.max_str_len)
        out.max_str_len = *overrides.max_str_len;
    return out;
}

void to_json(Json& j, const Limits& limits)
{
    j = Json{{"max_output_bytes", limits.max_output_bytes},
             {"max_str_len", limits.max_str_len},
             {"max_list_len", limits.max_list_len},
             {"max_dict_keys", limits.max_dict_keys}};
}

void from_json(const Json& j, Limits& limits)
{
    if (j.contains("max_output_bytes"))
        limits.max_output_bytes = j.at("max_output_bytes").get<size_t>();
    if (j.contains("max_str_len"))
        limits.max_str_len = j.at("max_str_len").get<size_t>();
    if (j.contains("max_list_len"))
        limits.max_list_len = j.at("max_list_len").get<size_t>();
    if (j.contains("max_dict_keys"))
        limits.max_dict_keys = j.at("max_dict_keys").get<size_t>();
}

size_t utf8_length(const std::string& s)
{
    size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80)
            ++n;
    return n;
}

size_t LimitEnforcer::serialized_size(const Json& value)
{
    return util::json::dump(value).size();
}

std::optional<FieldError> LimitEnforcer::check_payload_size(size_t byte_size) const
{
    if (byte_size <= limits_.max_output_bytes)
        return std::nullopt;
    return FieldError{ROOT_PATH, reason::LIMIT_EXCEEDED,
                      "output is " + std::to_string(byte_size) + " bytes, limit is " +
                          std::to_string(limits_.max_output_bytes)};
}

bool LimitEnforcer::check_node(const Json& value, const std::string& path,
                               ErrorList& errors) const
{
    if (value.is_string())
    {
        auto len = utf8_length(value.get_ref<const std::string&>());
        if (len > limits_.max_str_len)
        {
            errors.push_back({path, reason::LIMIT_EXCEEDED,
                              "string length " + std::to_string(len) + " exceeds " +
                                  std::to_string(limits_.max_str_len)});
            return false;
        }
    }
    else if (value.is_array())
    {
        if (value.size() > limits_.max_list_len)
        {
            errors.push_back({path, reason::LIMIT_EXCEEDED,
                              "list length " + std::to_string(value.size()) + " exceeds " +
                                  std::to_string(limits_.max_list_len)});
            return false;
        }
    }
    else if (value.is_object())
    {
        if (value.size() > limits_.max_dict_keys)
        {
            errors.push_back({path, reason::LIMIT_EXCEEDED,
                              "object has " + std::to_string(value.size()) + " keys, limit is " +
                                  std::to_string(limits_.max_dict_keys)});
            return false;
        }
    }
    return true;
}

void LimitEnforcer::scan(const Json& value, const std::string& path, ErrorList& errors) const
{
    if (!check_node(value, path, errors))
        return;
    if (value.is_array())
    {
        for (size_t i = 0; i < value.size(); ++i)
            scan(value[i], join_index(path, i), errors);
    }
    else if (value.is_object())
    {
        for (const auto& [key, child] : value.items())
            scan(child, join_key(path, key), errors);
    }
}

} // namespace agentval::schema
