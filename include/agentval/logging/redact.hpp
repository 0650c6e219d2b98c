#pragma once
#include "agentval/logging/record.hpp"
#include "agentval/types.hpp"

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace agentval::logging
{

/// Replaces sensitive substrings before a record leaves the process.
///
/// Patterns are applied in registration order, case-insensitively. Built-in
/// pattern names get a shape-preserving mask (email, phone, ssn,
/// credit_card); every other pattern replaces the whole match with
/// "[REDACTED]". Strings longer than MAX_TEXT_BYTES are replaced whole by
/// TOO_LONG without being scanned. Not safe to mutate while other threads are
/// redacting.
class Redactor
{
  public:
    using PatternList = std::vector<std::pair<std::string, std::string>>;

    static constexpr const char* REDACTED = "[REDACTED]";
    static constexpr const char* TOO_LONG = "[REDACTED - TOO LONG]";
    static constexpr int DEFAULT_MAX_DEPTH = 10;
    static constexpr size_t MAX_TEXT_BYTES = 8192;

    /// Uses default_patterns().
    Redactor();
    explicit Redactor(const PatternList& patterns);

    static const PatternList& default_patterns();
    /// Shared instance with the default pattern set.
    static const Redactor& default_instance();

    /// Registers (or replaces) a pattern. Throws std::regex_error on a bad pattern.
    void add_pattern(const std::string& name, const std::string& pattern);

    std::string redact_text(const std::string& text) const;
    /// Redacts every string in `data`; containers nested deeper than
    /// `max_depth` are replaced by "[REDACTED - MAX DEPTH]".
    Json redact_json(const Json& data, int max_depth = DEFAULT_MAX_DEPTH) const;
    /// Redacts context, error messages and the output sample; the redacted
    /// sample is then cut to OUTPUT_SAMPLE_BYTES.
    LogRecord redact(const LogRecord& record) const;

    size_t pattern_count() const
    {
        return patterns_.size();
    }

  private:
    enum class Style
    {
        Replace,
        Email,
        Phone,
        Ssn,
        CreditCard
    };

    struct Pattern
    {
        std::string name;
        std::regex re;
        Style style;
    };

    static Style style_for(const std::string& name);
    static std::string mask(Style style, const std::string& match);

    std::vector<Pattern> patterns_;
};

} // namespace agentval::logging
