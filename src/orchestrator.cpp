#include <contractrunner/orchestrator.hpp>

#include <chrono>      // std::chrono::system_clock
#include <exception>   // std::exception
#include <format>      // std::format
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::move

#include <nlohmann/json.hpp> // nlohmann::json

#include <contractrunner/execution_log.hpp> // ContractRunner::ExecutionLogger, ContractRunner::LogRecord
#include <contractrunner/logging.hpp>       // logd, logging::info, logging::path_to_utf8, logging::warn
#include <contractrunner/request.hpp>       // ContractRunner::ExecutionRequest, ContractRunner::Response, ContractRunner::sanitize_entry_name, ContractRunner::validate, ContractRunner::ValidationError
#include <contractrunner/sandbox.hpp>       // ContractRunner::ExecutionResult, ContractRunner::SandboxInvoker
#include <contractrunner/workspace.hpp>     // ContractRunner::StagingError, ContractRunner::Workspace, ContractRunner::WorkspaceManager

namespace
{

constexpr unsigned int status_ok { 200 };
constexpr unsigned int status_bad_request { 400 };
constexpr unsigned int status_internal_error { 500 };

class StageTracker
{
public:
    explicit StageTracker(std::string_view entry_name) noexcept :
        m_entry_name { entry_name } { }

    void enter(ContractRunner::Stage stage)
    {
        logd("`{:s}`: {:s} -> {:s}", m_entry_name, ContractRunner::to_string(m_stage), ContractRunner::to_string(stage));
        m_stage = stage;
    }

private:
    std::string_view m_entry_name;
    ContractRunner::Stage m_stage { ContractRunner::Stage::Validating };
};

}

namespace ContractRunner
{

std::string_view to_string(Stage stage) noexcept
{
    switch (stage)
    {
    case Stage::Validating:
        return "Validating";
    case Stage::Staging:
        return "Staging";
    case Stage::Executing:
        return "Executing";
    case Stage::Logging:
        return "Logging";
    case Stage::CleaningUp:
        return "CleaningUp";
    case Stage::Responding:
        return "Responding";
    case Stage::Failed:
        return "Failed";
    }

    return "Unknown";
}

Orchestrator::Orchestrator(const orchestrator_args& args) noexcept :
    m_workspaces { args.workspaces },
    m_sandbox { args.sandbox },
    m_logger { args.logger },
    m_max_artifact_size { args.max_artifact_size } { }

Response Orchestrator::handle(const ExecutionRequest& request) const
{
    StageTracker stage { request.entry_name };

    std::string entry_name;

    try
    {
        validate(request, m_max_artifact_size);
        entry_name = sanitize_entry_name(request.entry_name);
    }
    catch (const ValidationError& validation_error)
    {
        stage.enter(Stage::Failed);
        stage.enter(Stage::Responding);

        return { .status_code = status_bad_request, .body = validation_error.what() };
    }

    LogRecord record {
        .timestamp = std::chrono::system_clock::now(),
        .command = {},
        .entry_name = request.entry_name,
        .workspace_path = {},
        .standard_output = {},
        .standard_error = {},
        .failure_reason = {},
        .exit_code = {},
        .duration = {}
    };

    std::optional<Workspace> workspace;
    Response response;

    try
    {
        stage.enter(Stage::Staging);

        workspace.emplace(m_workspaces.allocate());
        record.workspace_path = logging::path_to_utf8(workspace->root());

        m_workspaces.place(*workspace, request.contract_code, request.test_code, entry_name);

        stage.enter(Stage::Executing);

        const auto invocation = m_sandbox.prepare(*workspace, entry_name);
        record.command = invocation.command_line();

        const auto result = m_sandbox.run(invocation);

        record.standard_output = result.standard_output;
        record.standard_error = result.standard_error;
        record.failure_reason = result.failure_reason;
        record.exit_code = result.exit_code;
        record.duration = result.duration;

        if (result.failed)
        {
            stage.enter(Stage::Failed);

            response = { .status_code = status_internal_error, .body = std::format("Sandbox execution error: {:s}", result.failure_reason.value_or("unknown error")) };
        }
        else
            response = { .status_code = status_ok, .body = result.standard_output + result.standard_error };
    }
    catch (const StagingError& staging_error)
    {
        stage.enter(Stage::Failed);

        record.failure_reason = staging_error.what();
        response = { .status_code = status_internal_error, .body = std::format("Staging error: {:s}", staging_error.what()) };
    }
    catch (const std::exception& exception)
    {
        stage.enter(Stage::Failed);

        record.failure_reason = exception.what();
        response = { .status_code = status_internal_error, .body = std::format("Server error: {:s}", exception.what()) };
    }

    stage.enter(Stage::Logging);

    if (record.failure_reason.has_value())
        logging::warn("`{:s}` failed: {:s}", entry_name, *record.failure_reason);
    else
        logging::info("`{:s}` ran in {:d} ms (exit status {:d}).", entry_name, record.duration.count(), record.exit_code.value_or(-1));

    m_logger.record(std::move(record));

    stage.enter(Stage::CleaningUp);

    if (workspace.has_value())
    {
        // The response is already decided; a leftover directory is only reported.
        if (const auto error_code = m_workspaces.release(*workspace))
            logging::warn("Could not remove the workspace `{:s}`: {:s}", logging::path_to_utf8(workspace->root()), error_code.message());
        else
            logd("Removed the workspace `{:s}`.", logging::path_to_utf8(workspace->root()));
    }

    stage.enter(Stage::Responding);

    return response;
}

Response Orchestrator::health_check()
{
    const nlohmann::json json {
        { "status", "OK" },
        { "message", "Backend server is running" }
    };

    return { .status_code = status_ok, .body = json.dump(), .content_type = "application/json" };
}

} // namespace ContractRunner
