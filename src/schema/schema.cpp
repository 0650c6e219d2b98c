#include "agentval/schema/schema.hpp"

#include <unordered_set>

namespace agentval::schema
{
namespace
{

std::string child_path(const std::string& parent, const std::string& key)
{
    return parent.empty() ? key : parent + "." + key;
}

std::optional<TypeSpec> primitive_from_name(const std::string& name)
{
    if (name == "string")
        return TypeSpec::string();
    if (name == "integer")
        return TypeSpec::integer();
    if (name == "float")
        return TypeSpec::floating();
    if (name == "boolean")
        return TypeSpec::boolean();
    return std::nullopt;
}

std::optional<size_t> limit_from_json(const OrderedJson& doc, const char* key)
{
    if (!doc.contains(key) || doc[key].is_null())
        return std::nullopt;
    const auto& v = doc[key];
    if (v.is_number_unsigned())
        return v.get<size_t>();
    if (v.is_number_integer() && v.get<long long>() >= 0)
        return static_cast<size_t>(v.get<long long>());
    throw SchemaError(std::string("schema limit '") + key + "' must be a non-negative integer");
}

// The document form is {"schema": {...}} plus optional numeric limits and
// nothing else. Any other key, or a limit key holding a type spec, means the
// input is a bare field mapping that happens to use one of these names.
bool is_document(const OrderedJson& doc)
{
    static const std::unordered_set<std::string> limit_keys = {"max_keys", "max_list_len",
                                                               "max_str_len"};
    if (!doc.contains("schema") || !doc["schema"].is_object())
        return false;
    for (auto it = doc.begin(); it != doc.end(); ++it)
    {
        if (it.key() == "schema")
            continue;
        if (!limit_keys.count(it.key()))
            return false;
        if (!it.value().is_number() && !it.value().is_null())
            return false;
    }
    return true;
}

Schema fields_from_json(const OrderedJson& mapping, const std::string& path);

TypeSpec spec_from_json(const OrderedJson& spec, const std::string& path)
{
    const std::string where = path.empty() ? "<root>" : path;

    if (spec.is_null())
        return TypeSpec::optional();

    if (spec.is_string())
    {
        auto name = spec.get<std::string>();
        bool optional = !name.empty() && name.back() == '?';
        if (optional)
            name.pop_back();
        auto prim = primitive_from_name(name);
        if (!prim)
            throw SchemaError("unsupported type specifier '" + spec.get<std::string>() +
                              "' at " + where);
        return optional ? TypeSpec::optional(*prim) : *prim;
    }

    if (spec.is_array())
    {
        if (spec.size() != 1)
            throw SchemaError("list specifier at " + where + " must have exactly one element");
        return TypeSpec::list_of(spec_from_json(spec[0], path + "[]"));
    }

    if (spec.is_object())
    {
        if (spec.contains("$optional"))
        {
            if (spec.size() != 1)
                throw SchemaError("'$optional' wrapper at " + where + " must be its only key");
            const auto& inner = spec["$optional"];
            if (inner.is_null())
                return TypeSpec::optional();
            return TypeSpec::optional(spec_from_json(inner, path));
        }
        return TypeSpec::object(fields_from_json(spec, path));
    }

    throw SchemaError("invalid type specifier " + spec.dump() + " at " + where);
}

Schema fields_from_json(const OrderedJson& mapping, const std::string& path)
{
    std::vector<Schema::Field> fields;
    fields.reserve(mapping.size());
    for (auto it = mapping.begin(); it != mapping.end(); ++it)
    {
        if (!it.key().empty() && it.key().front() == '$')
            throw SchemaError("reserved field name '" + it.key() + "' at " +
                              (path.empty() ? "<root>" : path));
        fields.emplace_back(it.key(), spec_from_json(it.value(), child_path(path, it.key())));
    }
    return Schema(std::move(fields));
}

} // namespace

std::string to_string(TypeKind kind)
{
    switch (kind)
    {
    case TypeKind::String:
        return "string";
    case TypeKind::Integer:
        return "integer";
    case TypeKind::Float:
        return "float";
    case TypeKind::Boolean:
        return "boolean";
    case TypeKind::List:
        return "list";
    case TypeKind::Object:
        return "object";
    case TypeKind::Optional:
        return "optional";
    }
    return "unknown";
}

TypeSpec TypeSpec::string()
{
    return TypeSpec(TypeKind::String);
}

TypeSpec TypeSpec::integer()
{
    return TypeSpec(TypeKind::Integer);
}

TypeSpec TypeSpec::floating()
{
    return TypeSpec(TypeKind::Float);
}

TypeSpec TypeSpec::boolean()
{
    return TypeSpec(TypeKind::Boolean);
}

TypeSpec TypeSpec::list_of(TypeSpec element)
{
    if (element.is_optional())
        throw SchemaError("list element specifier cannot be optional");
    TypeSpec spec(TypeKind::List);
    spec.inner_ = std::make_shared<const TypeSpec>(std::move(element));
    return spec;
}

TypeSpec TypeSpec::object(Schema nested)
{
    TypeSpec spec(TypeKind::Object);
    spec.nested_ = std::make_shared<const Schema>(std::move(nested));
    return spec;
}

TypeSpec TypeSpec::optional(TypeSpec inner)
{
    if (inner.is_optional())
        throw SchemaError("optional specifier cannot wrap another optional");
    TypeSpec spec(TypeKind::Optional);
    spec.inner_ = std::make_shared<const TypeSpec>(std::move(inner));
    return spec;
}

TypeSpec TypeSpec::optional()
{
    return TypeSpec(TypeKind::Optional);
}

bool TypeSpec::is_primitive() const
{
    return kind_ == TypeKind::String || kind_ == TypeKind::Integer || kind_ == TypeKind::Float ||
           kind_ == TypeKind::Boolean;
}

bool TypeSpec::accepts_string() const
{
    if (kind_ == TypeKind::String)
        return true;
    if (kind_ == TypeKind::Optional)
        return !inner_ || inner_->kind() == TypeKind::String;
    return false;
}

OrderedJson TypeSpec::to_json() const
{
    switch (kind_)
    {
    case TypeKind::List:
        return OrderedJson::array({inner_->to_json()});
    case TypeKind::Object:
        return nested_->fields_to_json();
    case TypeKind::Optional:
        if (!inner_)
            return nullptr;
        if (inner_->is_primitive())
            return to_string(inner_->kind()) + "?";
        return OrderedJson{{"$optional", inner_->to_json()}};
    default:
        return to_string(kind_);
    }
}

Schema::Schema(std::initializer_list<Field> fields) : fields_(fields)
{
    validate_definition();
}

Schema::Schema(std::vector<Field> fields, SchemaLimits limits)
    : fields_(std::move(fields)), limits_(limits)
{
    validate_definition();
}

void Schema::validate_definition() const
{
    std::unordered_set<std::string> seen;
    for (const auto& [name, spec] : fields_)
    {
        if (name.empty())
            throw SchemaError("schema field names must be non-empty");
        if (!seen.insert(name).second)
            throw SchemaError("duplicate schema field '" + name + "'");
        if (spec.kind() == TypeKind::List && spec.inner() == nullptr)
            throw SchemaError("list field '" + name + "' has no element specifier");
        if (spec.kind() == TypeKind::Object && spec.nested() == nullptr)
            throw SchemaError("object field '" + name + "' has no nested schema");
    }
}

const TypeSpec* Schema::find(const std::string& name) const
{
    for (const auto& field : fields_)
        if (field.first == name)
            return &field.second;
    return nullptr;
}

OrderedJson Schema::fields_to_json() const
{
    OrderedJson out = OrderedJson::object();
    for (const auto& [name, spec] : fields_)
        out[name] = spec.to_json();
    return out;
}

OrderedJson Schema::to_json() const
{
    OrderedJson doc = {{"schema", fields_to_json()}};
    doc["max_keys"] = limits_.max_keys ? OrderedJson(*limits_.max_keys) : OrderedJson(nullptr);
    doc["max_list_len"] =
        limits_.max_list_len ? OrderedJson(*limits_.max_list_len) : OrderedJson(nullptr);
    doc["max_str_len"] =
        limits_.max_str_len ? OrderedJson(*limits_.max_str_len) : OrderedJson(nullptr);
    return doc;
}

Schema Schema::from_json(const OrderedJson& doc)
{
    if (!doc.is_object())
        throw SchemaError("schema document must be a JSON object");

    if (is_document(doc))
    {
        SchemaLimits limits;
        limits.max_keys = limit_from_json(doc, "max_keys");
        limits.max_list_len = limit_from_json(doc, "max_list_len");
        limits.max_str_len = limit_from_json(doc, "max_str_len");
        Schema fields = fields_from_json(doc["schema"], "");
        return Schema(fields.fields_, limits);
    }
    return fields_from_json(doc, "");
}

Schema Schema::from_json(const Json& doc)
{
    return from_json(OrderedJson::parse(doc.dump()));
}

Schema Schema::parse(const std::string& text)
{
    OrderedJson doc = OrderedJson::parse(text, nullptr, false);
    if (doc.is_discarded())
        throw SchemaError("schema text is not valid JSON");
    return from_json(doc);
}

} // namespace agentval::schema
