#ifndef CONTRACTRUNNER_EXECUTION_LOG_HPP
#define CONTRACTRUNNER_EXECUTION_LOG_HPP

#include <atomic>     // std::atomic
#include <chrono>     // std::chrono::milliseconds, std::chrono::system_clock
#include <cstdint>    // std::uint64_t
#include <filesystem> // std::filesystem::path
#include <fstream>    // std::ofstream
#include <optional>   // std::optional
#include <string>     // std::string
#include <thread>     // std::thread

#include <boost/asio/executor_work_guard.hpp> // boost::asio::executor_work_guard
#include <boost/asio/io_context.hpp>          // boost::asio::io_context

#include <nlohmann/json_fwd.hpp> // nlohmann::json

/**
 * @file
 * @brief The shared, append-only log of every sandbox invocation.
 */
namespace ContractRunner
{

/** Everything needed to reconstruct a past invocation. */
struct LogRecord
{
    std::chrono::system_clock::time_point timestamp;

    /** The runtime command, as returned by SandboxInvocation::command_line. Empty if staging failed. */
    std::string command;

    std::string entry_name;

    /** The workspace root. Empty if it could not be allocated. */
    std::string workspace_path;

    std::string standard_output;
    std::string standard_error;

    /** The reason of the failure of the request, if it failed. */
    std::optional<std::string> failure_reason;

    std::optional<int> exit_code;

    std::chrono::milliseconds duration {};
};

/**
 * Converts a record into the JSON object written on each line of the log.
 * The timestamp is formatted as ISO 8601 in UTC.
 */
[[nodiscard]] nlohmann::json to_json(const LogRecord& record);

/**
 * Appends records to a single file from a dedicated writer thread.
 *
 * Requests submit their records and return immediately; the writer is the only owner of the file, so
 * records are never interleaved. A record that cannot be written is reported with `logging::warn` and
 * counted, and never affects the request that submitted it.
 */
class ExecutionLogger
{
public:
    /**
     * Starts the writer. The file and its parent directories are created on the first record.
     *
     * @param path the path of the log file, opened in append mode.
     */
    explicit ExecutionLogger(std::filesystem::path path);

    ExecutionLogger(const ExecutionLogger&) = delete;
    ExecutionLogger& operator=(const ExecutionLogger&) = delete;

    /** Writes every pending record, then stops the writer. */
    ~ExecutionLogger();

    /** Submits a record. It never throws. */
    void record(LogRecord record) noexcept;

    /** Blocks until every record submitted before this call has been written, or has failed to. */
    void flush();

    /** The amount of records that could not be written. */
    [[nodiscard]] std::uint64_t failed_records() const noexcept { return m_failed_records.load(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    void write(const LogRecord& record) noexcept;

    std::filesystem::path m_path;
    std::ofstream m_file;
    std::atomic<std::uint64_t> m_failed_records {};

    boost::asio::io_context m_context;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work;
    std::thread m_writer;
};

} // namespace ContractRunner

#endif
