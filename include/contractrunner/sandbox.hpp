#ifndef CONTRACTRUNNER_SANDBOX_HPP
#define CONTRACTRUNNER_SANDBOX_HPP

#include <chrono>      // std::chrono::milliseconds, std::chrono::seconds
#include <cstdint>     // std::uint64_t
#include <filesystem>  // std::filesystem::path
#include <optional>    // std::optional
#include <stdexcept>   // std::runtime_error
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include <contractrunner/workspace.hpp> // ContractRunner::Workspace

/**
 * @file
 * @brief Execution of staged artifacts inside a disposable container.
 */
namespace ContractRunner
{

/**
 * Thrown when the sandbox itself cannot be run: the runtime is missing, it cannot be started
 * or it reports an error of its own. A failing test inside the sandbox is not an operational error.
 */
class SandboxOperationalError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/** Arguments for the ContractRunner::SandboxInvoker. */
struct sandbox_args
{
    /** The path of the container runtime executable, e.g. `/usr/bin/docker`. */
    std::filesystem::path runtime;

    /** The image the container is created from. Selected externally, never by a request. */
    std::string image;

    /**
     * The directory inside the container where the contract is mounted. The file is named
     * after the sanitized entry name.
     */
    std::string contract_directory;

    /** Where the test file is mounted inside the container. It's also the argument given to the entry point. */
    std::string test_path;

    /** The command run inside the container, before the test path. If empty, the image's entry point is used. */
    std::vector<std::string> entry_point;

    /** The working directory inside the container. If empty, the image's default is kept. */
    std::string working_directory;

    /** The memory limit given to the runtime, e.g. `512m`. If empty, there is no limit. */
    std::string memory_limit;

    /** The maximum number of processes inside the container. If zero, there is no limit. */
    std::uint64_t pids_limit {};

    /**
     * The maximum duration of an invocation, including collecting its output. When it expires, the
     * runtime and every process it started are killed.
     */
    std::chrono::milliseconds timeout { std::chrono::seconds { 60 } };

    /** How long to wait for the runtime to remove a container whose invocation timed out. */
    std::chrono::milliseconds kill_timeout { std::chrono::seconds { 10 } };

    /**
     * The exit statuses that the runtime uses for its own errors (for Docker: daemon error, command
     * cannot be invoked, command not found). Any other status belongs to the sandboxed program.
     */
    std::vector<int> operational_exit_codes { 125, 126, 127 };
};

/** A host file made visible inside the container. */
struct Mount
{
    std::filesystem::path host_path;
    std::string container_path;
    bool read_only { true };
};

/** A fully built invocation, ready to be run. */
struct SandboxInvocation
{
    /** The runtime executable. */
    std::filesystem::path executable;

    /** The arguments given to the runtime, one token each. They never go through a shell. */
    std::vector<std::string> arguments;

    /** The working directory of the runtime process on the host: the workspace root. */
    std::filesystem::path working_directory;

    /** The mounts, in the order in which they appear in the arguments. */
    std::vector<Mount> mounts;

    /** The name given to the container, unique per request. */
    std::string container_name;

    /** The command as it would be typed in a shell, quoting the tokens that need it. Only meant for logs. */
    [[nodiscard]] std::string command_line() const;
};

/** The outcome of an invocation. */
struct ExecutionResult
{
    /** Everything written by the sandbox on its standard output, unmodified. */
    std::string standard_output;

    /** Everything written by the sandbox on its standard error, unmodified. */
    std::string standard_error;

    /** True if the invocation could not run, did not finish or the runtime was killed by a signal: an operational failure. */
    bool failed {};

    /** The description of the operational failure, when there is one. */
    std::optional<std::string> failure_reason;

    /** The exit status of the runtime, if it exited on its own. */
    std::optional<int> exit_code;

    /** True if the invocation was stopped because it exceeded the timeout. */
    bool timed_out {};

    /** The wall-clock duration of the invocation. */
    std::chrono::milliseconds duration {};
};

/** Builds and runs sandbox invocations. Every method can be called concurrently. */
class SandboxInvoker
{
public:
    explicit SandboxInvoker(sandbox_args args);

    /**
     * Builds the invocation for the given workspace: the contract is mounted at
     * `<contract_directory>/<entry_name><extension>`, the test file at `test_path`, and the entry point
     * is run against the test file in a container without network which is removed afterwards.
     *
     * @param workspace a workspace whose artifacts have been placed.
     * @param entry_name the sanitized entry name.
     *
     * @throws ValidationError if the entry name is not a sanitized one.
     * @throws StagingError if the artifacts have not been placed.
     */
    [[nodiscard]] SandboxInvocation prepare(const Workspace& workspace, std::string_view entry_name) const;

    /**
     * Runs the invocation, capturing its output. It never throws because of the sandbox: operational
     * failures, including the timeout, are reported through ExecutionResult::failed.
     */
    [[nodiscard]] ExecutionResult run(const SandboxInvocation& invocation) const;

    /** Equivalent to `run(prepare(workspace, entry_name))`. */
    [[nodiscard]] ExecutionResult invoke(const Workspace& workspace, std::string_view entry_name) const;

    [[nodiscard]] const sandbox_args& args() const noexcept { return m_args; }

private:
    void capture(const SandboxInvocation& invocation, ExecutionResult& result) const;
    void kill_container(const SandboxInvocation& invocation) const noexcept;

    sandbox_args m_args;
};

} // namespace ContractRunner

#endif
