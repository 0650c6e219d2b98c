#pragma once
#include "agentval/types.hpp"

#include <cstddef>
#include <string>

namespace agentval::schema
{

/// `$` + "age" -> "age", "address" + "zip" -> "address.zip"
inline std::string join_key(const std::string& parent, const std::string& key)
{
    return parent == ROOT_PATH ? key : parent + "." + key;
}

/// "tags" + 2 -> "tags[2]"
inline std::string join_index(const std::string& parent, size_t index)
{
    return parent + "[" + std::to_string(index) + "]";
}

} // namespace agentval::schema
