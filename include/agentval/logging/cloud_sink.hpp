#pragma once
#include "agentval/logging/sink.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace agentval::logging
{

/// Best-effort delivery of records to the hosted log endpoint.
///
/// POST {endpoint}/v1/logs with the record as JSON body and
/// "Authorization: Bearer <api_key>". Redirects are never followed.
class CloudLogSink : public LogSink
{
  public:
    static constexpr const char* LOGS_ROUTE = "/v1/logs";

    CloudLogSink(std::string endpoint, std::string api_key, int connect_timeout_s = 5,
                 int read_timeout_s = 10);

    /// Throws CloudLogError on a missing key, transport failure or non-2xx status.
    void write(const LogRecord& record) override;

    /// GET {endpoint}/v1/logs?limit=n. Accepts a JSON array or {"logs": [...]}.
    std::vector<LogRecord> fetch_recent(size_t n) const;

    const std::string& endpoint() const
    {
        return endpoint_;
    }

  private:
    std::string endpoint_;
    std::string api_key_;
    int connect_timeout_s_;
    int read_timeout_s_;
};

} // namespace agentval::logging
