#pragma once
#include "agentval/schema/schema.hpp"
#include "agentval/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace agentval::schema
{

/// True when `value`'s runtime type already is the primitive `target`.
/// Booleans never match Integer/Float and integers never match Float.
bool matches_primitive(const Json& value, TypeKind target);

/// Coercion table applied in ValidationMode::Coerce:
///   numeric string      -> Integer  (clean base-10 literal, fits int64)
///   numeric string      -> Float    (finite decimal)
///   true/false/1/0/yes/no/on/off (any case) -> Boolean
///   integer             -> Float
/// Anything else yields nullopt.
std::optional<Json> coerce(const Json& raw, TypeKind target);

std::optional<int64_t> parse_integer(const std::string& text);
std::optional<double> parse_float(const std::string& text);
std::optional<bool> parse_boolean(const std::string& text);

} // namespace agentval::schema
