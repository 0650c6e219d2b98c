/// @brief Record serialization, in-memory, file and composite sinks

#include "agentval/config.hpp"
#include "agentval/exceptions.hpp"
#include "agentval/logging/file_sink.hpp"
#include "agentval/logging/sink.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace agentval;
using namespace agentval::logging;
namespace fs = std::filesystem;

static fs::path temp_dir()
{
    std::random_device rd;
    auto dir = fs::temp_directory_path() / ("agentval_sinks_" + std::to_string(rd()));
    fs::create_directories(dir);
    return dir;
}

static LogRecord make_record(int attempt, bool valid)
{
    LogRecord r;
    r.ts = iso8601_now();
    r.correlation_id = "corr-1";
    r.valid = valid;
    r.attempts = attempt;
    r.duration_ms = 12;
    r.mode = "coerce";
    r.context = {{"user", "u"}};
    r.output_sample = "{\"age\":\"x\"}";
    if (!valid)
    {
        r.errors = {FieldError{"age", reason::COERCION_FAILED, "cannot coerce"}};
        r.reason = reason::COERCION_FAILED;
    }
    return r;
}

class FailingSink : public LogSink
{
  public:
    explicit FailingSink(std::string msg) : msg_(std::move(msg)) {}
    void write(const LogRecord&) override
    {
        throw std::runtime_error(msg_);
    }

  private:
    std::string msg_;
};

void test_record_json_fields()
{
    std::cout << "  test_record_json_fields... " << std::flush;
    Json j = make_record(2, false);
    for (const char* key : {"ts", "correlation_id", "valid", "errors", "attempts", "duration_ms",
                            "mode", "limits", "context", "output_sample", "reason"})
        assert(j.contains(key));
    assert(j["attempts"] == 2);
    assert(j["reason"] == "coercion_failed");
    assert(j["errors"][0]["path"] == "age");
    assert(j["limits"]["max_str_len"] == 8192);

    Json ok = make_record(1, true);
    assert(ok["reason"].is_null());
    assert(ok["errors"].empty());

    auto back = j.get<LogRecord>();
    assert(back.correlation_id == "corr-1");
    assert(back.errors.size() == 1);
    assert(back.reason && *back.reason == "coercion_failed");
    std::cout << "PASSED\n";
}

void test_timestamp_format()
{
    std::cout << "  test_timestamp_format... " << std::flush;
    auto ts = iso8601_now();
    assert(ts.size() == 24);
    assert(ts[4] == '-' && ts[10] == 'T' && ts[19] == '.' && ts.back() == 'Z');
    std::cout << "PASSED\n";
}

void test_output_sample_truncation()
{
    std::cout << "  test_output_sample_truncation... " << std::flush;
    assert(output_sample(Json("plain text")) == "plain text");
    assert(output_sample(Json{{"a", 1}}) == "{\"a\":1}");

    std::string long_text(OUTPUT_SAMPLE_BYTES + 50, 'x');
    assert(output_sample(Json(long_text)).size() == OUTPUT_SAMPLE_BYTES);

    // A two-byte character straddling the cut is dropped whole.
    std::string straddle = std::string(OUTPUT_SAMPLE_BYTES - 1, 'a') + "\xc3\xa9";
    auto sample = output_sample(Json(straddle));
    assert(sample.size() == OUTPUT_SAMPLE_BYTES - 1);
    std::cout << "PASSED\n";
}

void test_in_memory_sink()
{
    std::cout << "  test_in_memory_sink... " << std::flush;
    InMemoryLogSink sink;
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t)
        writers.emplace_back(
            [&sink, t]()
            {
                for (int i = 0; i < 25; ++i)
                    sink.write(make_record(t, true));
            });
    for (auto& w : writers)
        w.join();
    assert(sink.records().size() == 100);
    sink.reset();
    assert(sink.records().empty());
    std::cout << "PASSED\n";
}

void test_file_sink_appends_lines()
{
    std::cout << "  test_file_sink_appends_lines... " << std::flush;
    auto dir = temp_dir();
    auto path = dir / "nested" / "validations.jsonl";
    FileLogSink sink(path);
    assert(sink.recent(5).empty());

    for (int i = 1; i <= 4; ++i)
        sink.write(make_record(i, i == 4));
    {
        // Garbage lines, and objects whose fields have the wrong types, are
        // skipped on read.
        std::ofstream out(path, std::ios::app);
        out << "not json\n";
        out << "{\"attempts\":\"three\",\"valid\":\"x\"}\n";
        out << "{\"limits\":{\"max_str_len\":\"big\"}}\n";
    }
    sink.write(make_record(5, true));

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line))
        ++lines;
    assert(lines == 8);

    auto last = sink.recent(3);
    assert(last.size() == 3);
    assert(last[0].attempts == 3);
    assert(last[1].attempts == 4);
    assert(last[2].attempts == 5);
    assert(sink.recent(100).size() == 5);
    assert(sink.recent(0).empty());

    sink.clear();
    assert(!fs::exists(path));
    assert(sink.recent(5).empty());
    fs::remove_all(dir);
    std::cout << "PASSED\n";
}

void test_file_sink_concurrent_writers()
{
    std::cout << "  test_file_sink_concurrent_writers... " << std::flush;
    auto dir = temp_dir();
    auto path = dir / "validations.jsonl";
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t)
        writers.emplace_back(
            [path, t]()
            {
                FileLogSink sink(path);
                for (int i = 0; i < 20; ++i)
                    sink.write(make_record(t * 100 + i, false));
            });
    for (auto& w : writers)
        w.join();

    // Every line parses: no interleaving.
    assert(FileLogSink(path).recent(1000).size() == 80);
    fs::remove_all(dir);
    std::cout << "PASSED\n";
}

void test_file_sink_unwritable_path_throws()
{
    std::cout << "  test_file_sink_unwritable_path_throws... " << std::flush;
    auto dir = temp_dir();
    auto blocker = dir / "file";
    std::ofstream(blocker) << "x";
    FileLogSink sink(blocker / "child.jsonl");
    bool threw = false;
    try
    {
        sink.write(make_record(1, true));
    }
    catch (const Error&)
    {
        threw = true;
    }
    assert(threw);
    fs::remove_all(dir);
    std::cout << "PASSED\n";
}

void test_composite_sink()
{
    std::cout << "  test_composite_sink... " << std::flush;
    auto a = std::make_shared<InMemoryLogSink>();
    auto b = std::make_shared<InMemoryLogSink>();
    CompositeLogSink composite({a, nullptr, b});
    assert(composite.size() == 2);
    composite.write(make_record(1, true));
    assert(a->records().size() == 1);
    assert(b->records().size() == 1);

    // A failing child does not stop the others; failures are aggregated.
    composite.add(std::make_shared<FailingSink>("first down"));
    auto c = std::make_shared<InMemoryLogSink>();
    composite.add(c);
    composite.add(std::make_shared<FailingSink>("second down"));
    std::string message;
    try
    {
        composite.write(make_record(2, true));
    }
    catch (const Error& e)
    {
        message = e.what();
    }
    assert(message.find("first down") != std::string::npos);
    assert(message.find("second down") != std::string::npos);
    assert(c->records().size() == 1);
    assert(a->records().size() == 2);
    std::cout << "PASSED\n";
}

void test_default_sink_writes_to_configured_path()
{
    std::cout << "  test_default_sink_writes_to_configured_path... " << std::flush;
    auto dir = temp_dir();
    Config config;
    config.log_path = (dir / "v.jsonl").string();
    auto sink = make_default_sink(config);
    sink->write(make_record(1, true));
    assert(FileLogSink(dir / "v.jsonl").recent(10).size() == 1);
    fs::remove_all(dir);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Log Sink Tests\n";
    std::cout << "==============\n";
    test_record_json_fields();
    test_timestamp_format();
    test_output_sample_truncation();
    test_in_memory_sink();
    test_file_sink_appends_lines();
    test_file_sink_concurrent_writers();
    test_file_sink_unwritable_path_throws();
    test_composite_sink();
    test_default_sink_writes_to_configured_path();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
