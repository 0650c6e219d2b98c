#pragma once
#include "agentval/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace agentval::schema
{

struct SchemaLimits;

/// Resource bounds applied to every candidate before and during traversal.
struct Limits
{
    size_t max_output_bytes{131072};
    size_t max_str_len{8192};
    size_t max_list_len{2048};
    size_t max_dict_keys{512};

    /// Replace members for which the schema carries an override.
    Limits with_overrides(const SchemaLimits& overrides) const;
};

void to_json(Json& j, const Limits& limits);
void from_json(const Json& j, Limits& limits);

/// Number of code points in a UTF-8 string (continuation bytes are not counted).
size_t utf8_length(const std::string& s);

class LimitEnforcer
{
  public:
    explicit LimitEnforcer(Limits limits) : limits_(limits) {}

    const Limits& limits() const
    {
        return limits_;
    }

    /// Byte length of the compact serialization of `value`.
    static size_t serialized_size(const Json& value);

    /// Whole-payload pre-check. A violation is fatal for the attempt.
    std::optional<FieldError> check_payload_size(size_t byte_size) const;

    /// Checks `value` itself (string length, list length, key count).
    /// Returns false and records the violation when a bound is exceeded;
    /// the caller must not descend into a rejected value.
    bool check_node(const Json& value, const std::string& path, ErrorList& errors) const;

    /// Checks `value` and everything below it. Used for untyped values that
    /// the structural pass does not otherwise visit.
    void scan(const Json& value, const std::string& path, ErrorList& errors) const;

  private:
    Limits limits_;
};

} // namespace agentval::schema
