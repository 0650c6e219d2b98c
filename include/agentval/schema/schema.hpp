#pragma once
#include "agentval/exceptions.hpp"
#include "agentval/types.hpp"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentval::schema
{

class Schema;

enum class TypeKind
{
    String,
    Integer,
    Float,
    Boolean,
    List,
    Object,
    Optional
};

std::string to_string(TypeKind kind);

/// Closed set of type specifiers. Built through the static factories only;
/// every instance is immutable once constructed.
class TypeSpec
{
  public:
    static TypeSpec string();
    static TypeSpec integer();
    static TypeSpec floating();
    static TypeSpec boolean();
    static TypeSpec list_of(TypeSpec element);
    static TypeSpec object(Schema nested);
    /// Field may be absent or null; present values must match `inner`.
    static TypeSpec optional(TypeSpec inner);
    /// Field may be absent or null; present values are not type checked.
    static TypeSpec optional();

    TypeKind kind() const
    {
        return kind_;
    }
    bool is_primitive() const;
    bool is_optional() const
    {
        return kind_ == TypeKind::Optional;
    }
    /// Element spec for List, wrapped spec for Optional (nullptr when untyped).
    const TypeSpec* inner() const
    {
        return inner_.get();
    }
    /// Nested schema for Object, nullptr otherwise.
    const Schema* nested() const
    {
        return nested_.get();
    }
    /// True when a bare string value satisfies this spec.
    bool accepts_string() const;

    OrderedJson to_json() const;

  private:
    explicit TypeSpec(TypeKind kind) : kind_(kind) {}

    TypeKind kind_;
    std::shared_ptr<const TypeSpec> inner_;
    std::shared_ptr<const Schema> nested_;
};

/// Per-schema limit overrides; unset members defer to the configured Limits.
struct SchemaLimits
{
    std::optional<size_t> max_keys;
    std::optional<size_t> max_list_len;
    std::optional<size_t> max_str_len;
};

/// Ordered mapping from field name to TypeSpec.
///
/// Construction validates the definition and throws SchemaError on empty or
/// duplicate field names. A Schema is immutable and safe to share between
/// concurrent validations.
class Schema
{
  public:
    using Field = std::pair<std::string, TypeSpec>;

    Schema() = default;
    Schema(std::initializer_list<Field> fields);
    explicit Schema(std::vector<Field> fields, SchemaLimits limits = {});

    const std::vector<Field>& fields() const
    {
        return fields_;
    }
    size_t size() const
    {
        return fields_.size();
    }
    const TypeSpec* find(const std::string& name) const;
    const SchemaLimits& limits() const
    {
        return limits_;
    }

    /// Document form: {"schema": {...}, "max_keys": n, ...}
    OrderedJson to_json() const;
    /// Bare field mapping: {"name": "string", "tags": ["string"], ...}
    OrderedJson fields_to_json() const;

    /// Accepts the document form or a bare field mapping.
    static Schema from_json(const OrderedJson& doc);
    static Schema from_json(const Json& doc);
    /// Parses text preserving field declaration order.
    static Schema parse(const std::string& text);

  private:
    void validate_definition() const;

    std::vector<Field> fields_;
    SchemaLimits limits_;
};

} // namespace agentval::schema
