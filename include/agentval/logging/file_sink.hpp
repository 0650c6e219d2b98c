#pragma once
#include "agentval/logging/sink.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace agentval::logging
{

/// Append-only JSON-lines file. Each record is one self-contained line
/// written and flushed under a process-wide lock; the file is opened in
/// append mode per write so concurrent processes never overwrite each other.
class FileLogSink : public LogSink
{
  public:
    explicit FileLogSink(std::filesystem::path path);

    /// Throws Error when the file cannot be created or written.
    void write(const LogRecord& record) override;

    /// Last `n` records, oldest first. Lines that fail to parse are skipped.
    std::vector<LogRecord> recent(size_t n) const;
    void clear();

    const std::filesystem::path& path() const
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

} // namespace agentval::logging
