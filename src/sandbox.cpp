#include <contractrunner/sandbox.hpp>

#include <algorithm>    // std::ranges::all_of, std::ranges::contains
#include <cerrno>       // errno
#include <chrono>       // std::chrono::duration_cast, std::chrono::milliseconds, std::chrono::steady_clock
#include <cstddef>      // std::size_t
#include <exception>    // std::exception
#include <filesystem>   // std::filesystem::exists, std::filesystem::path
#include <format>       // std::format
#include <optional>     // std::optional
#include <stdexcept>    // std::invalid_argument
#include <string>       // std::string, std::to_string
#include <string_view>  // std::string_view
#include <system_error> // std::error_code
#include <utility>      // std::move
#include <vector>       // std::vector

#include <signal.h>   // SIGKILL, kill
#include <sys/wait.h> // WIFSIGNALED, WTERMSIG
#include <unistd.h>   // setpgid

#include <boost/asio/buffer.hpp>          // boost::asio::dynamic_buffer
#include <boost/asio/io_context.hpp>      // boost::asio::io_context
#include <boost/asio/read.hpp>            // boost::asio::async_read
#include <boost/asio/readable_pipe.hpp>   // boost::asio::readable_pipe
#include <boost/asio/steady_timer.hpp>    // boost::asio::steady_timer
#include <boost/process/v2/process.hpp>   // boost::process::process
#include <boost/process/v2/start_dir.hpp> // boost::process::process_start_dir
#include <boost/process/v2/stdio.hpp>     // boost::process::process_stdio
#include <boost/system/error_code.hpp>    // boost::system::error_code
#include <boost/system/system_error.hpp>  // boost::system::system_error

#include <contractrunner/logging.hpp>   // logd, logging::path_to_utf8, logging::warn
#include <contractrunner/request.hpp>   // ContractRunner::is_valid_entry_name, ContractRunner::sanitize_entry_name, ContractRunner::ValidationError
#include <contractrunner/workspace.hpp> // ContractRunner::StagingError, ContractRunner::Workspace

namespace
{

using namespace std::string_view_literals;

constexpr auto container_name_prefix { "contractrunner-"sv };

/** Makes the child the leader of a new process group, so the whole tree can be killed at once. */
struct new_process_group
{
    template<typename Launcher, typename Path>
    boost::system::error_code on_exec_setup(Launcher&, const Path&, const char* const*&) const
    {
        if (::setpgid(0, 0) != 0)
            return { errno, boost::system::system_category() };

        return {};
    }
};

constexpr bool is_shell_safe(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || "-_./:=,+@%"sv.contains(c);
}

std::string quote(std::string_view token)
{
    if (!token.empty() && std::ranges::all_of(token, is_shell_safe))
        return std::string { token };

    std::string quoted { "'" };

    for (const auto c : token)
    {
        if (c == '\'')
            quoted += R"('\'')";
        else
            quoted += c;
    }

    quoted += '\'';

    return quoted;
}

std::string_view trim(std::string_view view) noexcept
{
    const auto first = view.find_first_not_of(" \t\r\n");

    if (first == std::string_view::npos)
        return {};

    return view.substr(first, view.find_last_not_of(" \t\r\n") - first + 1);
}

std::string join_path(std::string_view directory, std::string_view filename)
{
    while (directory.size() > 1 && directory.ends_with('/'))
        directory.remove_suffix(1);

    if (directory == "/"sv)
        return std::format("/{:s}", filename);

    return std::format("{:s}/{:s}", directory, filename);
}

}

namespace ContractRunner
{

std::string SandboxInvocation::command_line() const
{
    auto command = quote(logging::path_to_utf8(executable));

    for (const auto& argument : arguments)
    {
        command += ' ';
        command += quote(argument);
    }

    return command;
}

SandboxInvoker::SandboxInvoker(sandbox_args args) :
    m_args { std::move(args) }
{
    if (m_args.timeout <= std::chrono::milliseconds::zero())
        throw std::invalid_argument { "The sandbox timeout must be positive." };
}

SandboxInvocation SandboxInvoker::prepare(const Workspace& workspace, std::string_view entry_name) const
{
    if (!is_valid_entry_name(entry_name) || sanitize_entry_name(entry_name) != entry_name)
        throw ValidationError { std::format("The entry name `{:s}` has not been sanitized.", entry_name) };

    if (workspace.released() || workspace.contract_file().empty())
        throw StagingError { "The artifacts have not been placed in the workspace." };

    SandboxInvocation invocation {
        .executable = m_args.runtime,
        .arguments = {},
        .working_directory = workspace.root(),
        .mounts = {
            Mount { .host_path = workspace.contract_file(), .container_path = join_path(m_args.contract_directory, workspace.contract_file().filename().string()), .read_only = true },
            Mount { .host_path = workspace.test_file(), .container_path = m_args.test_path, .read_only = true } },
        .container_name = std::format("{:s}{:s}", container_name_prefix, workspace.name())
    };

    auto& arguments = invocation.arguments;

    arguments = { "run", "--rm", "--name", invocation.container_name, "--network", "none" };

    if (!m_args.memory_limit.empty())
    {
        arguments.emplace_back("--memory");
        arguments.emplace_back(m_args.memory_limit);
    }

    if (m_args.pids_limit != 0)
    {
        arguments.emplace_back("--pids-limit");
        arguments.emplace_back(std::to_string(m_args.pids_limit));
    }

    for (const auto& mount : invocation.mounts)
    {
        arguments.emplace_back("--volume");
        arguments.emplace_back(std::format("{:s}:{:s}{:s}", logging::path_to_utf8(mount.host_path), mount.container_path, mount.read_only ? ":ro" : ""));
    }

    if (!m_args.working_directory.empty())
    {
        arguments.emplace_back("--workdir");
        arguments.emplace_back(m_args.working_directory);
    }

    arguments.emplace_back(m_args.image);
    arguments.insert(arguments.end(), m_args.entry_point.begin(), m_args.entry_point.end());
    arguments.emplace_back(m_args.test_path);

    return invocation;
}

ExecutionResult SandboxInvoker::run(const SandboxInvocation& invocation) const
{
    const auto start = std::chrono::steady_clock::now();

    ExecutionResult result;

    try
    {
        capture(invocation, result);
    }
    catch (const SandboxOperationalError& operational_error)
    {
        result.failed = true;
        result.failure_reason = operational_error.what();
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    logd("Container `{:s}` finished in {:d} ms.", invocation.container_name, result.duration.count());

    return result;
}

ExecutionResult SandboxInvoker::invoke(const Workspace& workspace, std::string_view entry_name) const
{
    return run(prepare(workspace, entry_name));
}

void SandboxInvoker::capture(const SandboxInvocation& invocation, ExecutionResult& result) const
{
    std::error_code exists_error;

    if (!std::filesystem::exists(invocation.executable, exists_error))
        throw SandboxOperationalError { std::format("The sandbox runtime is unavailable: `{:s}` does not exist.", logging::path_to_utf8(invocation.executable)) };

    boost::asio::io_context ctx;

    boost::asio::readable_pipe out_pipe { ctx };
    boost::asio::readable_pipe err_pipe { ctx };

    std::optional<boost::process::process> process;

    try
    {
        process.emplace(
            ctx,
            invocation.executable,
            invocation.arguments,
            boost::process::process_stdio { .in = nullptr, .out = out_pipe, .err = err_pipe },
            boost::process::process_start_dir { invocation.working_directory },
            new_process_group {});
    }
    catch (const boost::system::system_error& system_error)
    {
        throw SandboxOperationalError { std::format("Could not start the sandbox runtime: {:s}", system_error.what()) };
    }

    const auto pid = process->id();

    std::string standard_output;
    std::string standard_error;

    bool exited {};
    bool timed_out {};
    int exit_code {};
    boost::system::error_code wait_error;

    // Both streams and the exit status; the deadline covers all of them.
    auto pending { 3 };

    boost::asio::steady_timer deadline { ctx, m_args.timeout };

    const auto complete = [&pending, &deadline]
    {
        if (--pending == 0)
            deadline.cancel();
    };

    boost::asio::async_read(out_pipe, boost::asio::dynamic_buffer(standard_output), [&complete](boost::system::error_code, std::size_t)
        { complete(); });

    boost::asio::async_read(err_pipe, boost::asio::dynamic_buffer(standard_error), [&complete](boost::system::error_code, std::size_t)
        { complete(); });

    process->async_wait([&complete, &exited, &exit_code, &wait_error](boost::system::error_code ec, int code)
        {
            exited = !ec;
            wait_error = ec;
            exit_code = code;

            complete(); });

    deadline.async_wait([&](boost::system::error_code ec)
        {
            if (ec || pending == 0)
                return;

            timed_out = true;

            // The group outlives its leader while any member is alive, so its id cannot be reused yet.
            ::kill(-pid, SIGKILL);

            if (!exited)
                ::kill(pid, SIGKILL);

            boost::system::error_code ignored;
            out_pipe.close(ignored);
            err_pipe.close(ignored); });

    ctx.run();

    result.standard_output = std::move(standard_output);
    result.standard_error = std::move(standard_error);

    if (timed_out)
    {
        kill_container(invocation);

        result.failed = true;
        result.timed_out = true;
        result.failure_reason = "execution timed out";

        return;
    }

    if (wait_error)
        throw SandboxOperationalError { std::format("Could not wait for the sandbox runtime: {:s}", wait_error.message()) };

    // The exit code of a signalled runtime is its signal number, which is not a status of the tests.
    if (const auto native_status = process->native_exit_code(); WIFSIGNALED(native_status))
    {
        result.failed = true;
        result.failure_reason = std::format("The sandbox runtime was terminated by signal {:d}", WTERMSIG(native_status));

        return;
    }

    result.exit_code = exit_code;

    if (std::ranges::contains(m_args.operational_exit_codes, exit_code))
    {
        const auto details = trim(result.standard_error);

        result.failed = true;
        result.failure_reason = std::format("The sandbox runtime exited with status {:d}: {:s}", exit_code, details.empty() ? "no error output"sv : details);
    }
}

void SandboxInvoker::kill_container(const SandboxInvocation& invocation) const noexcept
{
    try
    {
        boost::asio::io_context ctx;

        boost::process::process process {
            ctx,
            invocation.executable,
            std::vector<std::string> { "kill", invocation.container_name },
            boost::process::process_stdio { .in = nullptr, .out = nullptr, .err = nullptr }
        };

        bool exited {};

        boost::asio::steady_timer timer { ctx, m_args.kill_timeout };

        process.async_wait([&exited, &timer](boost::system::error_code, int)
            {
                exited = true;
                timer.cancel(); });

        timer.async_wait([&exited, &process, &invocation](boost::system::error_code ec)
            {
                if (ec || exited)
                    return;

                logging::warn("The runtime did not remove the container `{:s}` in time.", invocation.container_name);

                ::kill(process.id(), SIGKILL); });

        ctx.run();
    }
    catch (const std::exception& exception)
    {
        try
        {
            logging::warn("Could not remove the container `{:s}`: {:s}", invocation.container_name, exception.what());
        }
        catch (const std::exception&)
        {
            // Nowhere left to report it.
        }
    }
}

} // namespace ContractRunner
