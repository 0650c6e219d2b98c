#pragma once
#include "agentval/logging/record.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace agentval
{
struct Config;
}

namespace agentval::logging
{

/// Destination for per-attempt validation records. Implementations may
/// throw on delivery failure; the retry orchestrator catches and reports it
/// without affecting the validation result.
class LogSink
{
  public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

/// Keeps records in memory. Thread-safe.
class InMemoryLogSink : public LogSink
{
  public:
    void write(const LogRecord& record) override;
    std::vector<LogRecord> records() const;
    void reset();

  private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

/// Forwards each record to every child. All children are attempted; if any
/// fail, one Error listing every failure is thrown afterwards.
class CompositeLogSink : public LogSink
{
  public:
    CompositeLogSink() = default;
    explicit CompositeLogSink(std::vector<std::shared_ptr<LogSink>> sinks);

    void add(std::shared_ptr<LogSink> sink);
    void write(const LogRecord& record) override;
    size_t size() const
    {
        return sinks_.size();
    }

  private:
    std::vector<std::shared_ptr<LogSink>> sinks_;
};

/// Local file sink, plus a cloud sink when `config.log_to_cloud` is set.
std::shared_ptr<LogSink> make_default_sink(const Config& config);

} // namespace agentval::logging
