#include "agentval/logging/file_sink.hpp"

#include "agentval/exceptions.hpp"
#include "agentval/util/json.hpp"

#include <deque>
#include <fstream>
#include <mutex>
#include <system_error>

namespace agentval::logging
{
namespace
{

std::mutex& file_mutex()
{
    static std::mutex m;
    return m;
}

} // namespace

FileLogSink::FileLogSink(std::filesystem::path path) : path_(std::move(path)) {}

void FileLogSink::write(const LogRecord& record)
{
    std::string line = util::json::dump(Json(record)) + "\n";

    std::lock_guard<std::mutex> lock(file_mutex());
    if (path_.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec)
            throw Error("cannot create log directory " + path_.parent_path().string() + ": " +
                        ec.message());
    }

    std::ofstream out(path_, std::ios::app | std::ios::binary);
    if (!out.is_open())
        throw Error("cannot open log file " + path_.string());
    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    out.flush();
    if (!out)
        throw Error("failed writing log file " + path_.string());
}

std::vector<LogRecord> FileLogSink::recent(size_t n) const
{
    std::lock_guard<std::mutex> lock(file_mutex());
    std::ifstream in(path_);
    if (!in.is_open() || n == 0)
        return {};

    std::deque<LogRecord> window;
    std::string line;
    while (std::getline(in, line))
    {
        if (line.empty())
            continue;
        auto doc = util::json::try_parse(line);
        if (!doc || !doc->is_object())
            continue;
        // Lines with mistyped fields are skipped like unparsable ones.
        try
        {
            window.push_back(doc->get<LogRecord>());
        }
        catch (const Json::exception&)
        {
            continue;
        }
        if (window.size() > n)
            window.pop_front();
    }
    return {window.begin(), window.end()};
}

void FileLogSink::clear()
{
    std::lock_guard<std::mutex> lock(file_mutex());
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec)
        throw Error("cannot remove log file " + path_.string() + ": " + ec.message());
}

} // namespace agentval::logging
