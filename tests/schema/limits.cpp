/// @brief Resource bounds: payload pre-check, per-node limits, schema overrides

#include "agentval/schema/limits.hpp"
#include "agentval/schema/validator.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace agentval;
using namespace agentval::schema;

void test_payload_size_is_fatal()
{
    std::cout << "  test_payload_size_is_fatal... " << std::flush;
    Schema s{{"name", TypeSpec::string()}, {"age", TypeSpec::integer()}};
    Limits limits;
    limits.max_output_bytes = 32;

    // Would also be missing "age" and mistyped "name", but only the size is reported.
    Json big = {{"name", 5}, {"pad", std::string(64, 'x')}};
    auto out = validate_output(big, s, ValidationMode::Strict, limits);
    assert(!out.ok());
    assert(out.errors().size() == 1);
    assert(out.errors()[0].path == "$");
    assert(out.errors()[0].reason == reason::LIMIT_EXCEEDED);

    // Raw text is measured in bytes even when it does not parse.
    out = validate_output(Json(std::string(40, '{')), s, ValidationMode::Coerce, limits);
    assert(out.errors().size() == 1);
    assert(out.errors()[0].reason == reason::LIMIT_EXCEEDED);

    // Exactly at the limit passes the pre-check.
    Json exact = {{"age", 1}, {"name", "a"}};
    limits.max_output_bytes = LimitEnforcer::serialized_size(exact);
    assert(validate_output(exact, s, ValidationMode::Strict, limits).ok());
    std::cout << "PASSED\n";
}

void test_string_and_list_limits_accumulate()
{
    std::cout << "  test_string_and_list_limits_accumulate... " << std::flush;
    Schema s{{"title", TypeSpec::string()},
             {"tags", TypeSpec::list_of(TypeSpec::string())},
             {"count", TypeSpec::integer()}};
    Limits limits;
    limits.max_str_len = 4;
    limits.max_list_len = 2;

    Json candidate = {{"title", "too long"}, {"tags", {"a", "b", "c"}}, {"count", "x"}};
    auto out = validate_output(candidate, s, ValidationMode::Strict, limits);
    assert(!out.ok());
    assert(out.errors().size() == 3);
    assert(out.errors()[0].path == "title");
    assert(out.errors()[0].reason == reason::LIMIT_EXCEEDED);
    assert(out.errors()[1].path == "tags");
    assert(out.errors()[1].reason == reason::LIMIT_EXCEEDED);
    assert(out.errors()[2].path == "count");
    assert(out.errors()[2].reason == reason::TYPE_MISMATCH);

    // Elements inside an accepted list are checked individually.
    candidate = {{"title", "ok"}, {"tags", {"fine", "oversize"}}, {"count", 1}};
    out = validate_output(candidate, s, ValidationMode::Strict, limits);
    assert(out.errors().size() == 1);
    assert(out.errors()[0].path == "tags[1]");
    std::cout << "PASSED\n";
}

void test_key_count_limit()
{
    std::cout << "  test_key_count_limit... " << std::flush;
    Schema s{{"a", TypeSpec::integer()}};
    Limits limits;
    limits.max_dict_keys = 2;

    auto out = validate_output(Json{{"a", 1}, {"b", 2}, {"c", 3}}, s, ValidationMode::Strict,
                               limits);
    assert(out.errors().size() == 1);
    assert(out.errors()[0].path == "$");
    assert(out.errors()[0].reason == reason::LIMIT_EXCEEDED);

    // Extra keys within the bound are dropped from the normalized value.
    out = validate_output(Json{{"a", 1}, {"b", 2}}, s, ValidationMode::Strict, limits);
    assert(out.ok());
    assert(out.value() == (Json{{"a", 1}}));
    std::cout << "PASSED\n";
}

void test_string_length_counts_code_points()
{
    std::cout << "  test_string_length_counts_code_points... " << std::flush;
    assert(utf8_length("") == 0);
    assert(utf8_length("abc") == 3);
    assert(utf8_length("h\xc3\xa9llo") == 5);          // é is two bytes
    assert(utf8_length("\xe2\x82\xac\xf0\x9f\x98\x80") == 2); // euro sign, emoji

    Schema s{{"word", TypeSpec::string()}};
    Limits limits;
    limits.max_str_len = 5;
    assert(validate_output(Json{{"word", "h\xc3\xa9llo"}}, s, ValidationMode::Strict, limits).ok());
    std::cout << "PASSED\n";
}

void test_untyped_optional_is_scanned()
{
    std::cout << "  test_untyped_optional_is_scanned... " << std::flush;
    Schema s{{"extra", TypeSpec::optional()}};
    Limits limits;
    limits.max_str_len = 3;

    Json candidate = {{"extra", {{"deep", {"ok", "toolong"}}}}};
    auto out = validate_output(candidate, s, ValidationMode::Strict, limits);
    assert(out.errors().size() == 1);
    assert(out.errors()[0].path == "extra.deep[1]");
    assert(out.errors()[0].reason == reason::LIMIT_EXCEEDED);
    std::cout << "PASSED\n";
}

void test_schema_overrides()
{
    std::cout << "  test_schema_overrides... " << std::flush;
    auto s = Schema::parse(R"({"schema": {"tags": ["string"]}, "max_list_len": 1})");
    Validator v(s, ValidationMode::Strict, Limits{});
    assert(v.limits().max_list_len == 1);
    assert(v.limits().max_str_len == 8192);

    auto out = v.validate(Json{{"tags", {"a", "b"}}});
    assert(out.errors().size() == 1);
    assert(out.errors()[0].path == "tags");
    assert(out.errors()[0].reason == reason::LIMIT_EXCEEDED);

    SchemaLimits overrides;
    overrides.max_str_len = 10;
    Limits merged = Limits{}.with_overrides(overrides);
    assert(merged.max_str_len == 10);
    assert(merged.max_dict_keys == 512);
    assert(merged.max_output_bytes == 131072);
    std::cout << "PASSED\n";
}

void test_limits_json()
{
    std::cout << "  test_limits_json... " << std::flush;
    Json j = Limits{};
    assert(j["max_output_bytes"] == 131072);
    assert(j["max_str_len"] == 8192);
    assert(j["max_list_len"] == 2048);
    assert(j["max_dict_keys"] == 512);

    auto parsed = Json{{"max_str_len", 16}}.get<Limits>();
    assert(parsed.max_str_len == 16);
    assert(parsed.max_list_len == 2048);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Limit Tests\n";
    std::cout << "===========\n";
    test_payload_size_is_fatal();
    test_string_and_list_limits_accumulate();
    test_key_count_limit();
    test_string_length_counts_code_points();
    test_untyped_optional_is_scanned();
    test_schema_overrides();
    test_limits_json();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
