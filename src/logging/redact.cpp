#include "agentval/logging/redact.hpp"

#include "agentval/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace agentval::logging
{
namespace
{

std::string digits_of(const std::string& s)
{
    std::string out;
    std::copy_if(s.begin(), s.end(), std::back_inserter(out),
                 [](unsigned char c) { return std::isdigit(c) != 0; });
    return out;
}

} // namespace

const Redactor::PatternList& Redactor::default_patterns()
{
    static const PatternList patterns = {
        {"license_key",
         R"((license[_-]?key|licensekey)\s*[:=]\s*['"]?([a-zA-Z0-9_-]{20,})['"]?)"},
        {"license_key_value", R"(^license-[a-zA-Z0-9_-]{20,}$)"},
        {"api_key", R"((api[_-]?key|apikey)\s*[:=]\s*['"]?([a-zA-Z0-9_-]{20,})['"]?)"},
        {"jwt",
         R"((bearer|jwt|token)\s*[:=]?\s*['"]?([a-zA-Z0-9_-]+\.[a-zA-Z0-9_-]+\.[a-zA-Z0-9_-]+)['"]?)"},
        {"email", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"},
        {"phone", R"((phone|tel|mobile)\s*[:=]\s*['"]?(\+?[0-9 ()-]{10,})['"]?)"},
        {"ssn", R"(\b\d{3}-\d{2}-\d{4}\b)"},
        {"credit_card", R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)"},
        {"password", R"((password|passwd|pwd)\s*[:=]\s*['"]?([^\s'"]+)['"]?)"},
        {"secret", R"((secret|key)\s*[:=]\s*['"]?([a-zA-Z0-9_-]{20,})['"]?)"},
    };
    return patterns;
}

const Redactor& Redactor::default_instance()
{
    static const Redactor instance;
    return instance;
}

Redactor::Redactor() : Redactor(default_patterns()) {}

Redactor::Redactor(const PatternList& patterns)
{
    for (const auto& [name, pattern] : patterns)
        add_pattern(name, pattern);
}

void Redactor::add_pattern(const std::string& name, const std::string& pattern)
{
    Pattern p{name, std::regex(pattern, std::regex::ECMAScript | std::regex::icase),
              style_for(name)};
    auto it = std::find_if(patterns_.begin(), patterns_.end(),
                           [&](const Pattern& existing) { return existing.name == name; });
    if (it != patterns_.end())
        *it = std::move(p);
    else
        patterns_.push_back(std::move(p));
}

Redactor::Style Redactor::style_for(const std::string& name)
{
    if (name == "email")
        return Style::Email;
    if (name == "phone")
        return Style::Phone;
    if (name == "ssn")
        return Style::Ssn;
    if (name == "credit_card")
        return Style::CreditCard;
    return Style::Replace;
}

std::string Redactor::mask(Style style, const std::string& match)
{
    switch (style)
    {
    case Style::Email:
    {
        auto at = match.find('@');
        if (at == std::string::npos)
            return REDACTED;
        auto user = match.substr(0, at);
        std::string masked = user.size() <= 2
                                 ? std::string(user.size(), '*')
                                 : user.front() + std::string(user.size() - 2, '*') + user.back();
        return masked + match.substr(at);
    }
    case Style::Phone:
    {
        auto digits = digits_of(match);
        if (digits.size() < 4)
            return REDACTED;
        return "***-***-" + digits.substr(digits.size() - 4);
    }
    case Style::Ssn:
        return "***-**-" + match.substr(match.size() - 4);
    case Style::CreditCard:
    {
        auto digits = digits_of(match);
        if (digits.size() < 4)
            return REDACTED;
        return std::string(digits.size() - 4, '*') + digits.substr(digits.size() - 4);
    }
    case Style::Replace:
        break;
    }
    return REDACTED;
}

std::string Redactor::redact_text(const std::string& text) const
{
    // std::regex recursion depth grows with the subject length.
    if (text.size() > MAX_TEXT_BYTES)
        return TOO_LONG;

    std::string current = text;
    for (const auto& p : patterns_)
    {
        std::string out;
        auto last = current.cbegin();
        for (std::sregex_iterator it(current.begin(), current.end(), p.re), end; it != end; ++it)
        {
            const auto& m = *it;
            out.append(last, m[0].first);
            out += mask(p.style, m.str(0));
            last = m[0].second;
        }
        out.append(last, current.cend());
        current = std::move(out);
    }
    return current;
}

Json Redactor::redact_json(const Json& data, int max_depth) const
{
    if (max_depth <= 0)
        return "[REDACTED - MAX DEPTH]";

    if (data.is_object())
    {
        Json out = Json::object();
        for (const auto& [key, value] : data.items())
            out[key] = redact_json(value, max_depth - 1);
        return out;
    }
    if (data.is_array())
    {
        Json out = Json::array();
        for (const auto& item : data)
            out.push_back(redact_json(item, max_depth - 1));
        return out;
    }
    if (data.is_string())
        return redact_text(data.get_ref<const std::string&>());
    return data;
}

LogRecord Redactor::redact(const LogRecord& record) const
{
    LogRecord out = record;
    out.context = redact_json(record.context);
    out.output_sample =
        util::json::truncate_utf8(redact_text(record.output_sample), OUTPUT_SAMPLE_BYTES);
    for (auto& err : out.errors)
        err.message = redact_text(err.message);
    return out;
}

} // namespace agentval::logging
