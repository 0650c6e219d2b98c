#include "agentval/logging/sink.hpp"

#include "agentval/config.hpp"
#include "agentval/exceptions.hpp"
#include "agentval/logging/cloud_sink.hpp"
#include "agentval/logging/file_sink.hpp"

namespace agentval::logging
{

void InMemoryLogSink::write(const LogRecord& record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<LogRecord> InMemoryLogSink::records() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

void InMemoryLogSink::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

CompositeLogSink::CompositeLogSink(std::vector<std::shared_ptr<LogSink>> sinks)
{
    for (auto& sink : sinks)
        add(std::move(sink));
}

void CompositeLogSink::add(std::shared_ptr<LogSink> sink)
{
    if (sink)
        sinks_.push_back(std::move(sink));
}

void CompositeLogSink::write(const LogRecord& record)
{
    std::string failures;
    for (const auto& sink : sinks_)
    {
        try
        {
            sink->write(record);
        }
        catch (const std::exception& e)
        {
            if (!failures.empty())
                failures += "; ";
            failures += e.what();
        }
    }
    if (!failures.empty())
        throw Error("log sink failure: " + failures);
}

std::shared_ptr<LogSink> make_default_sink(const Config& config)
{
    auto composite = std::make_shared<CompositeLogSink>();
    composite->add(std::make_shared<FileLogSink>(config.effective_log_path()));
    if (config.log_to_cloud)
        composite->add(
            std::make_shared<CloudLogSink>(config.cloud_endpoint, config.api_key.value_or("")));
    return composite;
}

} // namespace agentval::logging
