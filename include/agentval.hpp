#pragma once

/// @file agentval.hpp
/// @brief Main header for agentval - validation of generated structured output
///
/// Usage:
/// @code
/// #include <agentval.hpp>
///
/// using namespace agentval;
///
/// using schema::TypeSpec;
/// schema::Schema user_schema{{"name", TypeSpec::string()},
///                            {"age", TypeSpec::integer()},
///                            {"tags", TypeSpec::list_of(TypeSpec::string())}};
///
/// ValidateOptions opts;
/// opts.mode = ValidationMode::Coerce;
/// opts.retry_fn = [](const std::string& prompt, const Json& ctx) { return call_model(prompt); };
/// Json user = validate(Json(raw_text), user_schema, opts);
/// @endcode

// Core types and exceptions
#include "agentval/types.hpp"
#include "agentval/exceptions.hpp"
#include "agentval/config.hpp"
#include "agentval/correlation.hpp"
#include "agentval/version.hpp"

// Schema and structural validation
#include "agentval/schema/schema.hpp"
#include "agentval/schema/limits.hpp"
#include "agentval/schema/coerce.hpp"
#include "agentval/schema/validator.hpp"

// Retry loop
#include "agentval/retry/policy.hpp"
#include "agentval/retry/orchestrator.hpp"

// Log records and sinks
#include "agentval/logging/record.hpp"
#include "agentval/logging/redact.hpp"
#include "agentval/logging/sink.hpp"
#include "agentval/logging/file_sink.hpp"
#include "agentval/logging/cloud_sink.hpp"

#include "agentval/validate.hpp"
