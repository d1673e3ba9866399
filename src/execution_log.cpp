#include <contractrunner/execution_log.hpp>

#include <chrono>       // std::chrono::floor, std::chrono::milliseconds
#include <exception>    // std::exception
#include <filesystem>   // std::filesystem::create_directories, std::filesystem::path
#include <format>       // std::format
#include <fstream>      // std::ofstream
#include <future>       // std::promise
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::error_code
#include <utility>      // std::move

#include <boost/asio/post.hpp> // boost::asio::post

#include <nlohmann/json.hpp> // nlohmann::json

#include <contractrunner/logging.hpp> // logging::path_to_utf8, logging::warn

namespace
{

/** Reports a lost record. Neither the writer nor the request that submitted the record can be failed by it. */
void report_failure(std::string_view message, std::string_view reason) noexcept
{
    try
    {
        logging::warn("{:s}: {:s}", message, reason);
    }
    catch (const std::exception&)
    {
        // Nowhere left to report it.
    }
}

}

namespace ContractRunner
{

nlohmann::json to_json(const LogRecord& record)
{
    nlohmann::json json {
        { "timestamp", std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(record.timestamp)) },
        { "command", record.command },
        { "entryName", record.entry_name },
        { "workspacePath", record.workspace_path },
        { "stdout", record.standard_output },
        { "stderr", record.standard_error },
        { "failureReason", nullptr },
        { "exitCode", nullptr },
        { "durationMs", record.duration.count() }
    };

    if (record.failure_reason.has_value())
        json["failureReason"] = *record.failure_reason;

    if (record.exit_code.has_value())
        json["exitCode"] = *record.exit_code;

    return json;
}

ExecutionLogger::ExecutionLogger(std::filesystem::path path) :
    m_path { std::move(path) },
    m_work { m_context.get_executor() },
    m_writer { [this]
        { m_context.run(); } }
{
}

ExecutionLogger::~ExecutionLogger()
{
    // Without the guard, run() returns once the queue is empty.
    m_work.reset();

    if (m_writer.joinable())
        m_writer.join();
}

void ExecutionLogger::record(LogRecord record) noexcept
{
    try
    {
        boost::asio::post(m_context, [this, record = std::move(record)]
            { write(record); });
    }
    catch (const std::exception& exception)
    {
        ++m_failed_records;
        report_failure("Could not submit the execution record", exception.what());
    }
}

void ExecutionLogger::flush()
{
    std::promise<void> written;
    auto future = written.get_future();

    boost::asio::post(m_context, [&written]
        { written.set_value(); });

    future.wait();
}

void ExecutionLogger::write(const LogRecord& record) noexcept
{
    try
    {
        if (!m_file.is_open())
        {
            if (m_path.has_parent_path())
            {
                std::error_code error_code;
                std::filesystem::create_directories(m_path.parent_path(), error_code);
            }

            m_file.open(m_path, std::ios::app | std::ios::binary);

            if (!m_file.is_open())
            {
                const auto path = logging::path_to_utf8(m_path);

                ++m_failed_records;
                report_failure("Could not open the execution log", path);

                return;
            }
        }

        // Sandbox output is untrusted and may not be valid UTF-8.
        m_file << to_json(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        m_file.flush();

        if (!m_file.good())
        {
            // Reopened on the next record.
            m_file.close();
            m_file.clear();

            const auto path = logging::path_to_utf8(m_path);

            ++m_failed_records;
            report_failure("Could not write to the execution log", path);
        }
    }
    catch (const std::exception& exception)
    {
        ++m_failed_records;
        report_failure("Could not write to the execution log", exception.what());
    }
}

} // namespace ContractRunner
