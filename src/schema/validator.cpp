#include "agentval/schema/validator.hpp"

#include "agentval/schema/coerce.hpp"
#include "agentval/schema/path.hpp"
#include "agentval/util/json.hpp"

namespace agentval::schema
{
namespace
{

std::string type_name(const Json& value)
{
    if (value.is_number_integer())
        return "integer";
    if (value.is_number_float())
        return "float";
    if (value.is_object())
        return "object";
    if (value.is_array())
        return "list";
    return value.type_name();
}

} // namespace

ValidationOutcome ValidationOutcome::success(Json value)
{
    ValidationOutcome out;
    out.ok_ = true;
    out.value_ = std::move(value);
    return out;
}

ValidationOutcome ValidationOutcome::failure(ErrorList errors)
{
    ValidationOutcome out;
    out.errors_ = std::move(errors);
    return out;
}

Validator::Validator(Schema schema, ValidationMode mode, const Limits& limits)
    : schema_(std::move(schema)), mode_(mode), enforcer_(limits.with_overrides(schema_.limits()))
{
}

std::string Validator::text_fallback_field() const
{
    if (schema_.size() != 1)
        return {};
    const auto& [name, spec] = schema_.fields().front();
    return spec.accepts_string() ? name : std::string();
}

ValidationOutcome Validator::validate(const Json& candidate) const
{
    Json parsed;
    bool unparsable = false;
    if (candidate.is_string())
    {
        const auto& text = candidate.get_ref<const std::string&>();
        if (auto doc = util::json::try_parse(text))
            parsed = std::move(*doc);
        else
            unparsable = true;
    }
    else
    {
        parsed = candidate;
    }

    size_t bytes = unparsable ? candidate.get_ref<const std::string&>().size()
                              : LimitEnforcer::serialized_size(parsed);
    if (auto err = enforcer_.check_payload_size(bytes))
        return ValidationOutcome::failure(ErrorList{*err});

    if (!unparsable && parsed.is_object())
        return validate_structure(parsed);

    // Text that is not a JSON object is only accepted when the schema has a
    // single string field to carry it. A bare JSON string is carried unquoted;
    // any other text (including "42" or "[1,2]") is carried verbatim.
    if (mode_ == ValidationMode::Coerce && candidate.is_string())
    {
        const Json& text = !unparsable && parsed.is_string() ? parsed : candidate;
        auto field = text_fallback_field();
        if (!field.empty())
            return validate_structure(Json{{field, text}});
    }

    std::string message = unparsable ? "output is not valid JSON"
                                     : "expected an object, got " + type_name(parsed);
    return ValidationOutcome::failure(
        ErrorList{FieldError{ROOT_PATH, reason::TYPE_MISMATCH, message}});
}

ValidationOutcome Validator::validate_structure(const Json& candidate) const
{
    ErrorList errors;
    if (!candidate.is_object())
    {
        errors.push_back({ROOT_PATH, reason::TYPE_MISMATCH,
                          "expected an object, got " + type_name(candidate)});
        return ValidationOutcome::failure(std::move(errors));
    }
    if (!enforcer_.check_node(candidate, ROOT_PATH, errors))
        return ValidationOutcome::failure(std::move(errors));

    Json out = Json::object();
    check_object(schema_, candidate, ROOT_PATH, out, errors);
    if (!errors.empty())
        return ValidationOutcome::failure(std::move(errors));
    return ValidationOutcome::success(std::move(out));
}

void Validator::check_object(const Schema& schema, const Json& input, const std::string& path,
                             Json& out, ErrorList& errors) const
{
    for (const auto& [name, spec] : schema.fields())
    {
        auto field_path = join_key(path, name);
        auto it = input.find(name);
        bool absent = it == input.end() || (spec.is_optional() && it->is_null());
        if (absent)
        {
            if (!spec.is_optional())
                errors.push_back({field_path, reason::MISSING_FIELD, "required field is missing"});
            continue;
        }

        Json value;
        if (check_value(spec, *it, field_path, value, errors))
            out[name] = std::move(value);
    }
}

bool Validator::check_value(const TypeSpec& spec, const Json& value, const std::string& path,
                            Json& out, ErrorList& errors) const
{
    if (spec.is_optional())
    {
        if (spec.inner() != nullptr)
            return check_value(*spec.inner(), value, path, out, errors);
        size_t before = errors.size();
        enforcer_.scan(value, path, errors);
        if (errors.size() != before)
            return false;
        out = value;
        return true;
    }

    if (!enforcer_.check_node(value, path, errors))
        return false;

    switch (spec.kind())
    {
    case TypeKind::List:
    {
        if (!value.is_array())
        {
            errors.push_back(
                {path, reason::TYPE_MISMATCH, "expected list, got " + type_name(value)});
            return false;
        }
        bool ok = true;
        out = Json::array();
        for (size_t i = 0; i < value.size(); ++i)
        {
            Json element;
            if (check_value(*spec.inner(), value[i], join_index(path, i), element, errors))
                out.push_back(std::move(element));
            else
                ok = false;
        }
        return ok;
    }
    case TypeKind::Object:
    {
        if (!value.is_object())
        {
            errors.push_back(
                {path, reason::TYPE_MISMATCH, "expected object, got " + type_name(value)});
            return false;
        }
        size_t before = errors.size();
        out = Json::object();
        check_object(*spec.nested(), value, path, out, errors);
        return errors.size() == before;
    }
    default:
        return check_primitive(spec, value, path, out, errors);
    }
}

bool Validator::check_primitive(const TypeSpec& spec, const Json& value, const std::string& path,
                                Json& out, ErrorList& errors) const
{
    if (matches_primitive(value, spec.kind()))
    {
        out = value;
        return true;
    }

    const auto expected = to_string(spec.kind());
    if (mode_ == ValidationMode::Strict)
    {
        errors.push_back({path, reason::TYPE_MISMATCH,
                          "expected " + expected + ", got " + type_name(value)});
        return false;
    }

    if (auto coerced = coerce(value, spec.kind()))
    {
        out = std::move(*coerced);
        return true;
    }
    errors.push_back(
        {path, reason::COERCION_FAILED, "cannot coerce " + type_name(value) + " to " + expected});
    return false;
}

ValidationOutcome validate_output(const Json& candidate, const Schema& schema, ValidationMode mode,
                                  const Limits& limits)
{
    return Validator(schema, mode, limits).validate(candidate);
}

} // namespace agentval::schema
