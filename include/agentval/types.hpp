#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentval
{

using Json = nlohmann::json;
/// Insertion-ordered JSON, used where field declaration order matters.
using OrderedJson = nlohmann::ordered_json;

/// How strictly primitive types are matched.
enum class ValidationMode
{
    Strict, ///< Runtime type must already match
    Coerce  ///< Apply the coercion table before rejecting a mismatch
};

inline std::string to_string(ValidationMode mode)
{
    switch (mode)
    {
    case ValidationMode::Strict:
        return "strict";
    case ValidationMode::Coerce:
        return "coerce";
    }
    return "strict";
}

/// Unknown names fall back to Strict.
inline ValidationMode validation_mode_from_string(const std::string& s)
{
    if (s == "coerce" || s == "COERCE")
        return ValidationMode::Coerce;
    return ValidationMode::Strict;
}

/// Machine-stable reason codes attached to a FieldError.
namespace reason
{
constexpr const char* TYPE_MISMATCH = "type_mismatch";
constexpr const char* MISSING_FIELD = "missing_field";
constexpr const char* COERCION_FAILED = "coercion_failed";
constexpr const char* LIMIT_EXCEEDED = "limit_exceeded";
constexpr const char* TIMEOUT = "timeout";
constexpr const char* GENERATOR_ERROR = "generator_error";
} // namespace reason

/// Path used for errors about the candidate as a whole.
constexpr const char* ROOT_PATH = "$";

/// One located validation problem, e.g. {"tags[1]", "type_mismatch"}.
struct FieldError
{
    std::string path;
    std::string reason;
    std::string message;

    bool operator==(const FieldError& other) const
    {
        return path == other.path && reason == other.reason;
    }
};

inline void to_json(Json& j, const FieldError& e)
{
    j = Json{{"path", e.path}, {"reason", e.reason}};
    if (!e.message.empty())
        j["message"] = e.message;
}

inline void from_json(const Json& j, FieldError& e)
{
    e.path = j.at("path").get<std::string>();
    e.reason = j.at("reason").get<std::string>();
    e.message = j.value("message", "");
}

using ErrorList = std::vector<FieldError>;

} // namespace agentval
