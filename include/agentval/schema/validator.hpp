#pragma once
#include "agentval/schema/limits.hpp"
#include "agentval/schema/schema.hpp"
#include "agentval/types.hpp"

#include <string>

namespace agentval::schema
{

/// Normalized value on success, ordered non-empty error list on failure.
class ValidationOutcome
{
  public:
    ValidationOutcome() = default;

    static ValidationOutcome success(Json value);
    /// `errors` must be non-empty.
    static ValidationOutcome failure(ErrorList errors);

    bool ok() const
    {
        return ok_;
    }
    explicit operator bool() const
    {
        return ok_;
    }
    const Json& value() const
    {
        return value_;
    }
    const ErrorList& errors() const
    {
        return errors_;
    }

  private:
    bool ok_{false};
    Json value_;
    ErrorList errors_;
};

/// Depth-first structural matcher.
///
/// Errors are collected rather than thrown, in traversal order: field
/// declaration order, then list index order. The payload byte-size check is
/// the only check that aborts an attempt early.
class Validator
{
  public:
    /// Schema limit overrides are applied on top of `limits`.
    Validator(Schema schema, ValidationMode mode, const Limits& limits);

    /// Full per-attempt pipeline. A string candidate is raw text and is parsed
    /// as JSON first; then the size pre-check, the text fallback, and the
    /// structural pass run.
    ValidationOutcome validate(const Json& candidate) const;

    /// Structural pass over an already parsed candidate.
    ValidationOutcome validate_structure(const Json& candidate) const;

    const Schema& schema() const
    {
        return schema_;
    }
    ValidationMode mode() const
    {
        return mode_;
    }
    const Limits& limits() const
    {
        return enforcer_.limits();
    }

  private:
    /// Name of the single string-accepting field that raw text may be wrapped
    /// into in Coerce mode, or empty when the schema does not allow it.
    std::string text_fallback_field() const;

    void check_object(const Schema& schema, const Json& input, const std::string& path,
                      Json& out, ErrorList& errors) const;
    bool check_value(const TypeSpec& spec, const Json& value, const std::string& path, Json& out,
                     ErrorList& errors) const;
    bool check_primitive(const TypeSpec& spec, const Json& value, const std::string& path,
                         Json& out, ErrorList& errors) const;

    Schema schema_;
    ValidationMode mode_;
    LimitEnforcer enforcer_;
};

/// Convenience wrapper: Validator(schema, mode, limits).validate(candidate).
ValidationOutcome validate_output(const Json& candidate, const Schema& schema,
                                  ValidationMode mode = ValidationMode::Strict,
                                  const Limits& limits = {});

} // namespace agentval::schema
