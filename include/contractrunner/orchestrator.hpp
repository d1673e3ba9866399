#ifndef CONTRACTRUNNER_ORCHESTRATOR_HPP
#define CONTRACTRUNNER_ORCHESTRATOR_HPP

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <string_view> // std::string_view

#include <contractrunner/execution_log.hpp> // ContractRunner::ExecutionLogger
#include <contractrunner/request.hpp>       // ContractRunner::ExecutionRequest, ContractRunner::Response
#include <contractrunner/sandbox.hpp>       // ContractRunner::SandboxInvoker
#include <contractrunner/workspace.hpp>     // ContractRunner::WorkspaceManager

/**
 * @file
 * @brief Drives a request through staging, execution, logging and cleanup.
 */
namespace ContractRunner
{

/** The stages a request goes through. */
enum class Stage : std::uint8_t
{
    Validating,
    Staging,
    Executing,
    Logging,
    CleaningUp,
    Responding,
    Failed
};

[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

/** Arguments for the ContractRunner::Orchestrator. */
struct orchestrator_args
{
    /** Allocates and removes the workspaces. */
    const WorkspaceManager& workspaces;

    /** Runs the staged artifacts. */
    const SandboxInvoker& sandbox;

    /** Receives one record per request that passed validation. */
    ExecutionLogger& logger;

    /** The maximum size in bytes of each artifact. If zero, there is no limit. */
    std::size_t max_artifact_size;
};

/**
 * The boundary of the pipeline. Every call to handle() produces a response, and the workspace it
 * allocated is gone by the time the response is returned. Calls are independent and can run concurrently.
 */
class Orchestrator
{
public:
    explicit Orchestrator(const orchestrator_args& args) noexcept;

    /**
     * Runs the request.
     *
     * @return
     * - 400 if a field is missing or malformed. Nothing is created and nothing is logged.
     * - 500 if the workspace could not be staged or the sandbox could not run, with the reason in the body.
     * - 200 otherwise, even if the tests failed, with the standard output followed by the standard error
     *   of the sandbox as the body.
     */
    [[nodiscard]] Response handle(const ExecutionRequest& request) const;

    /** A fixed liveness payload. It touches neither the filesystem nor the sandbox. */
    [[nodiscard]] static Response health_check();

private:
    const WorkspaceManager& m_workspaces;
    const SandboxInvoker& m_sandbox;
    ExecutionLogger& m_logger;
    std::size_t m_max_artifact_size;
};

} // namespace ContractRunner

#endif
