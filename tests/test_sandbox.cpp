#define BOOST_TEST_MODULE test_sandbox
#include <boost/test/unit_test.hpp>

#include <algorithm>   // std::ranges::find
#include <chrono>      // std::chrono::milliseconds, std::chrono::seconds, std::chrono::steady_clock
#include <stdexcept>   // std::invalid_argument
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::move
#include <vector>      // std::vector

#include <contractrunner/logging.hpp>   // logging::path_to_utf8
#include <contractrunner/request.hpp>   // ContractRunner::ValidationError
#include <contractrunner/sandbox.hpp>   // ContractRunner::sandbox_args, ContractRunner::SandboxInvocation, ContractRunner::SandboxInvoker
#include <contractrunner/workspace.hpp> // ContractRunner::StagingError, ContractRunner::Workspace, ContractRunner::workspace_layout, ContractRunner::WorkspaceManager

#include "test_utils.hpp" // fake_runtime, ScratchDirectory

using namespace std::string_view_literals;

namespace
{

constexpr auto contract_directory { "/app/blueprints"sv };
constexpr auto container_test_path { "/app/tests/test_contract.py"sv };

ContractRunner::sandbox_args make_args(std::string image, std::chrono::milliseconds timeout = std::chrono::seconds { 10 })
{
    return {
        .runtime = fake_runtime,
        .image = std::move(image),
        .contract_directory = std::string { contract_directory },
        .test_path = std::string { container_test_path },
        .entry_point = { "pytest" },
        .working_directory = {},
        .memory_limit = {},
        .pids_limit = 0,
        .timeout = timeout
    };
}

/** A workspace with the demo artifacts already placed. */
struct StagedWorkspace
{
    StagedWorkspace() :
        workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } },
        workspace { workspaces.allocate() }
    {
        workspaces.place(workspace, "x = 1", "assert x == 1", "demo");
    }

    ScratchDirectory scratch;
    ContractRunner::WorkspaceManager workspaces;
    ContractRunner::Workspace workspace;
};

}

BOOST_AUTO_TEST_CASE(invocation_arguments)
{
    const StagedWorkspace staged;

    auto args = make_args("example/image");
    args.entry_point = { "pytest", "-q" };
    args.working_directory = "/app";
    args.memory_limit = "256m";
    args.pids_limit = 64;

    const ContractRunner::SandboxInvoker sandbox { std::move(args) };

    const auto invocation = sandbox.prepare(staged.workspace, "demo");

    const auto container_name = "contractrunner-" + staged.workspace.name();

    const std::vector<std::string> expected {
        "run", "--rm", "--name", container_name, "--network", "none",
        "--memory", "256m", "--pids-limit", "64",
        "--volume", logging::path_to_utf8(staged.workspace.contract_file()) + ":/app/blueprints/demo.py:ro",
        "--volume", logging::path_to_utf8(staged.workspace.test_file()) + ":/app/tests/test_contract.py:ro",
        "--workdir", "/app",
        "example/image", "pytest", "-q", "/app/tests/test_contract.py"
    };

    BOOST_CHECK_EQUAL_COLLECTIONS(invocation.arguments.begin(), invocation.arguments.end(), expected.begin(), expected.end());

    BOOST_CHECK(invocation.executable == fake_runtime);
    BOOST_CHECK(invocation.working_directory == staged.workspace.root());
    BOOST_CHECK_EQUAL(invocation.container_name, container_name);

    // Every mount comes from the workspace.
    BOOST_REQUIRE_EQUAL(invocation.mounts.size(), 2U);

    for (const auto& mount : invocation.mounts)
    {
        BOOST_CHECK(mount.host_path.parent_path() == staged.workspace.root());
        BOOST_CHECK(mount.read_only);
    }
}

BOOST_AUTO_TEST_CASE(optional_arguments_are_omitted)
{
    const StagedWorkspace staged;

    auto args = make_args("example/image");
    args.entry_point.clear();
    args.contract_directory = "/app/blueprints/";

    const ContractRunner::SandboxInvoker sandbox { std::move(args) };

    const auto invocation = sandbox.prepare(staged.workspace, "demo");

    for (const auto flag : { "--memory"sv, "--pids-limit"sv, "--workdir"sv })
        BOOST_CHECK(std::ranges::find(invocation.arguments, flag) == invocation.arguments.end());

    BOOST_CHECK_EQUAL(invocation.mounts.front().container_path, "/app/blueprints/demo.py");

    // Without an entry point, the image's own is run against the test file.
    BOOST_REQUIRE_GE(invocation.arguments.size(), 2U);
    BOOST_CHECK_EQUAL(invocation.arguments.back(), container_test_path);
    BOOST_CHECK_EQUAL(invocation.arguments[invocation.arguments.size() - 2], "example/image");
}

BOOST_AUTO_TEST_CASE(prepare_requires_a_staged_workspace)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };
    const ContractRunner::SandboxInvoker sandbox { make_args("echo") };

    auto workspace = workspaces.allocate();

    BOOST_CHECK_THROW(static_cast<void>(sandbox.prepare(workspace, "demo")), ContractRunner::StagingError);

    workspaces.place(workspace, "x = 1", "assert x == 1", "demo");

    BOOST_CHECK_THROW(static_cast<void>(sandbox.prepare(workspace, "Demo")), ContractRunner::ValidationError);
    BOOST_CHECK_THROW(static_cast<void>(sandbox.prepare(workspace, "../../etc")), ContractRunner::ValidationError);
    BOOST_CHECK_NO_THROW(static_cast<void>(sandbox.prepare(workspace, "demo")));
}

BOOST_AUTO_TEST_CASE(command_line)
{
    const ContractRunner::SandboxInvocation invocation {
        .executable = "/usr/bin/docker",
        .arguments = { "run", "--name", "it's", "a b", "" },
        .working_directory = {},
        .mounts = {},
        .container_name = {}
    };

    BOOST_CHECK_EQUAL(invocation.command_line(), R"(/usr/bin/docker run --name 'it'\''s' 'a b' '')");
}

BOOST_AUTO_TEST_CASE(captures_the_output)
{
    const StagedWorkspace staged;
    const ContractRunner::SandboxInvoker sandbox { make_args("echo") };

    const auto result = sandbox.invoke(staged.workspace, "demo");

    BOOST_CHECK(!result.failed);
    BOOST_CHECK(!result.timed_out);
    BOOST_CHECK(!result.failure_reason.has_value());
    BOOST_REQUIRE(result.exit_code.has_value());
    BOOST_CHECK_EQUAL(*result.exit_code, 0);
    BOOST_CHECK_EQUAL(result.standard_output, "x = 1\nassert x == 1\n");
    BOOST_CHECK(result.standard_error.empty());
}

BOOST_AUTO_TEST_CASE(separate_streams)
{
    const StagedWorkspace staged;
    const ContractRunner::SandboxInvoker sandbox { make_args("streams") };

    const auto result = sandbox.invoke(staged.workspace, "demo");

    BOOST_CHECK(!result.failed);
    BOOST_CHECK_EQUAL(result.standard_output, "out\n");
    BOOST_CHECK_EQUAL(result.standard_error, "err\n");
}

BOOST_AUTO_TEST_CASE(container_paths)
{
    const StagedWorkspace staged;
    const ContractRunner::SandboxInvoker sandbox { make_args("mounts") };

    const auto result = sandbox.invoke(staged.workspace, "demo");

    BOOST_CHECK(!result.failed);
    BOOST_CHECK_EQUAL(result.standard_output, "/app/blueprints/demo.py:ro\n/app/tests/test_contract.py:ro\npytest /app/tests/test_contract.py\n");
}

BOOST_AUTO_TEST_CASE(failing_tests_are_not_operational_failures)
{
    const StagedWorkspace staged;
    const ContractRunner::SandboxInvoker sandbox { make_args("fail-tests") };

    const auto result = sandbox.invoke(staged.workspace, "demo");

    BOOST_CHECK(!result.failed);
    BOOST_REQUIRE(result.exit_code.has_value());
    BOOST_CHECK_EQUAL(*result.exit_code, 1);
    BOOST_CHECK_EQUAL(result.standard_output, "1 failed, 0 passed\n");
}

BOOST_AUTO_TEST_CASE(runtime_errors)
{
    const StagedWorkspace staged;
    const ContractRunner::SandboxInvoker sandbox { make_args("runtime-error") };

    const auto result = sandbox.invoke(staged.workspace, "demo");

    BOOST_CHECK(result.failed);
    BOOST_CHECK(!result.timed_out);
    BOOST_REQUIRE(result.exit_code.has_value());
    BOOST_CHECK_EQUAL(*result.exit_code, 125);
    BOOST_REQUIRE(result.failure_reason.has_value());
    BOOST_CHECK(result.failure_reason->contains("No such image"));
}

BOOST_AUTO_TEST_CASE(runtime_killed_by_a_signal)
{
    const StagedWorkspace staged;
    const ContractRunner::SandboxInvoker sandbox { make_args("crash") };

    const auto result = sandbox.invoke(staged.workspace, "demo");

    BOOST_CHECK(result.failed);
    BOOST_CHECK(!result.timed_out);
    BOOST_CHECK(!result.exit_code.has_value());
    BOOST_REQUIRE(result.failure_reason.has_value());
    BOOST_CHECK_EQUAL(*result.failure_reason, "The sandbox runtime was terminated by signal 9");
    BOOST_CHECK_EQUAL(result.standard_output, "partial output\n");
}

BOOST_AUTO_TEST_CASE(missing_runtime)
{
    const StagedWorkspace staged;

    auto args = make_args("echo");
    args.runtime = staged.scratch.path() / "no-such-runtime";

    const ContractRunner::SandboxInvoker sandbox { std::move(args) };

    const auto result = sandbox.invoke(staged.workspace, "demo");

    BOOST_CHECK(result.failed);
    BOOST_CHECK(!result.exit_code.has_value());
    BOOST_REQUIRE(result.failure_reason.has_value());
    BOOST_CHECK(result.failure_reason->contains("unavailable"));
}

BOOST_AUTO_TEST_CASE(timeout)
{
    const StagedWorkspace staged;
    const ContractRunner::SandboxInvoker sandbox { make_args("hang", std::chrono::seconds { 1 }) };

    const auto start = std::chrono::steady_clock::now();
    const auto result = sandbox.invoke(staged.workspace, "demo");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    BOOST_CHECK(result.failed);
    BOOST_CHECK(result.timed_out);
    BOOST_CHECK(!result.exit_code.has_value());
    BOOST_REQUIRE(result.failure_reason.has_value());
    BOOST_CHECK_EQUAL(*result.failure_reason, "execution timed out");

    // The runtime spawns a grandchild holding the pipes; it has to be killed as well.
    BOOST_CHECK(elapsed < std::chrono::seconds { 10 });
    BOOST_CHECK(result.duration >= std::chrono::seconds { 1 });
}

BOOST_AUTO_TEST_CASE(invalid_timeout)
{
    BOOST_CHECK_THROW(ContractRunner::SandboxInvoker { make_args("echo", std::chrono::milliseconds::zero()) }, std::invalid_argument);
}
