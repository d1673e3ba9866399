#define BOOST_TEST_MODULE test_workspace
#include <boost/test/unit_test.hpp>

#include <filesystem> // std::filesystem::exists, std::filesystem::is_directory, std::filesystem::path, std::filesystem::permissions
#include <fstream>    // std::ofstream
#include <optional>   // std::optional
#include <set>        // std::set
#include <stdexcept>  // std::runtime_error
#include <string>     // std::string
#include <utility>    // std::move
#include <vector>     // std::vector

#include <unistd.h> // close, dup, dup2, geteuid, STDERR_FILENO

#include <contractrunner/request.hpp>   // ContractRunner::ValidationError
#include <contractrunner/workspace.hpp> // ContractRunner::StagingError, ContractRunner::Workspace, ContractRunner::workspace_layout, ContractRunner::WorkspaceManager

#include "test_utils.hpp" // count_entries, read_contents, ScratchDirectory

using namespace std::string_literals;

BOOST_AUTO_TEST_CASE(allocation_creates_the_temp_root)
{
    const ScratchDirectory scratch;
    const auto temp_root = scratch.path() / "nested" / "root";

    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = temp_root } };

    auto workspace = workspaces.allocate();

    BOOST_CHECK(std::filesystem::is_directory(workspace.root()));
    BOOST_CHECK(workspace.root().parent_path() == std::filesystem::absolute(temp_root));
    BOOST_CHECK(workspace.contract_file().empty());
    BOOST_CHECK(!workspace.released());

    BOOST_CHECK(!workspaces.release(workspace));
    BOOST_CHECK(workspace.released());

    // The temp root is shared and stays.
    BOOST_CHECK(std::filesystem::is_directory(temp_root));
    BOOST_CHECK_EQUAL(count_entries(temp_root), 0U);
}

BOOST_AUTO_TEST_CASE(unique_names)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    std::vector<ContractRunner::Workspace> allocated;
    std::set<std::string> names;

    for (auto i { 0 }; i < 64; ++i)
    {
        allocated.emplace_back(workspaces.allocate());
        names.emplace(allocated.back().name());
    }

    BOOST_CHECK_EQUAL(names.size(), allocated.size());
    BOOST_CHECK_EQUAL(count_entries(scratch.path()), allocated.size());

    allocated.clear();

    BOOST_CHECK_EQUAL(count_entries(scratch.path()), 0U);
}

BOOST_AUTO_TEST_CASE(place_artifacts)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    auto workspace = workspaces.allocate();

    workspaces.place(workspace, "x = 1", "assert x == 1", "demo");

    BOOST_CHECK(workspace.contract_file() == workspace.root() / "demo.py");
    BOOST_CHECK(workspace.test_file() == workspace.root() / "test-contract.py");
    BOOST_CHECK_EQUAL(read_contents(workspace.contract_file()), "x = 1");
    BOOST_CHECK_EQUAL(read_contents(workspace.test_file()), "assert x == 1");
    BOOST_CHECK_EQUAL(count_entries(workspace.root()), 2U);
}

BOOST_AUTO_TEST_CASE(entry_named_like_the_test_file)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    for (const auto* entry_name : { "test_contract", "test-contract", "Test_Contract" })
    {
        auto workspace = workspaces.allocate();

        BOOST_CHECK_NO_THROW(workspaces.place(workspace, "x = 1", "assert x == 1", entry_name));
        BOOST_CHECK(workspace.contract_file().filename() == "test_contract.py");
        BOOST_CHECK(workspace.contract_file() != workspace.test_file());
        BOOST_CHECK_EQUAL(read_contents(workspace.contract_file()), "x = 1");
        BOOST_CHECK_EQUAL(read_contents(workspace.test_file()), "assert x == 1");
    }
}

BOOST_AUTO_TEST_CASE(artifacts_are_verbatim)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    const std::string contract { "line one\r\nline two\n\0binary\xff"s };
    const std::string test { "# -*- coding: utf-8 -*-\nassert 'caf\xc3\xa9'\n" };

    auto workspace = workspaces.allocate();
    workspaces.place(workspace, contract, test, "Verbatim-Check");

    BOOST_CHECK(workspace.contract_file().filename() == "verbatim_check.py");
    BOOST_CHECK(read_contents(workspace.contract_file()) == contract);
    BOOST_CHECK(read_contents(workspace.test_file()) == test);
}

BOOST_AUTO_TEST_CASE(custom_layout)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout {
        .temp_root = scratch.path(),
        .contract_extension = ".js",
        .test_filename = "contract.test.js" } };

    auto workspace = workspaces.allocate();
    workspaces.place(workspace, "module.exports = 1;", "test()", "demo");

    BOOST_CHECK(workspace.contract_file().filename() == "demo.js");
    BOOST_CHECK(workspace.test_file().filename() == "contract.test.js");
}

BOOST_AUTO_TEST_CASE(invalid_entry_name)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    auto workspace = workspaces.allocate();

    BOOST_CHECK_THROW(workspaces.place(workspace, "x = 1", "assert x == 1", "../../etc"), ContractRunner::ValidationError);
    BOOST_CHECK_EQUAL(count_entries(workspace.root()), 0U);
    BOOST_CHECK_EQUAL(count_entries(scratch.path()), 1U);
}

BOOST_AUTO_TEST_CASE(refuses_to_overwrite)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout {
        .temp_root = scratch.path(),
        .contract_extension = ".py",
        .test_filename = "demo.py" } };

    auto workspace = workspaces.allocate();

    // The contract and the test file would have the same name.
    BOOST_CHECK_THROW(workspaces.place(workspace, "x = 1", "assert x == 1", "demo"), ContractRunner::StagingError);
    BOOST_CHECK_EQUAL(read_contents(workspace.root() / "demo.py"), "x = 1");
}

BOOST_AUTO_TEST_CASE(release_is_idempotent)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    auto workspace = workspaces.allocate();
    workspaces.place(workspace, "x = 1", "assert x == 1", "demo");

    const auto root = workspace.root();

    BOOST_CHECK(!workspaces.release(workspace));
    BOOST_CHECK(!std::filesystem::exists(root));
    BOOST_CHECK(!workspaces.release(workspace));

    BOOST_CHECK_THROW(workspaces.place(workspace, "x = 1", "assert x == 1", "demo"), ContractRunner::StagingError);
}

BOOST_AUTO_TEST_CASE(release_on_scope_exit)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    std::filesystem::path root;

    try
    {
        auto workspace = workspaces.allocate();
        root = workspace.root();

        workspaces.place(workspace, "x = 1", "assert x == 1", "demo");

        throw std::runtime_error { "Interrupted." };
    }
    catch (const std::runtime_error&)
    {
    }

    BOOST_CHECK(!root.empty());
    BOOST_CHECK(!std::filesystem::exists(root));
}

BOOST_AUTO_TEST_CASE(moved_workspace)
{
    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    std::optional<ContractRunner::Workspace> owner;

    {
        auto workspace = workspaces.allocate();
        owner.emplace(std::move(workspace));
    }

    // The moved-from handle does not remove the directory.
    BOOST_REQUIRE(std::filesystem::is_directory(owner->root()));

    const auto root = owner->root();
    owner.reset();

    BOOST_CHECK(!std::filesystem::exists(root));
}

BOOST_AUTO_TEST_CASE(unusable_temp_root)
{
    const ScratchDirectory scratch;
    const auto blocker = scratch.path() / "file";

    std::ofstream { blocker } << "not a directory";

    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = blocker / "root" } };

    BOOST_CHECK_THROW(static_cast<void>(workspaces.allocate()), ContractRunner::StagingError);
}

BOOST_AUTO_TEST_CASE(failed_removal_is_only_reported)
{
    // Permissions do not stop root from removing the files.
    if (::geteuid() == 0)
    {
        BOOST_TEST_MESSAGE("Running as root, the workspace cannot be made unremovable.");
        return;
    }

    const ScratchDirectory scratch;
    const ContractRunner::WorkspaceManager workspaces { ContractRunner::workspace_layout { .temp_root = scratch.path() } };

    std::filesystem::path root;

    {
        auto workspace = workspaces.allocate();
        workspaces.place(workspace, "x = 1", "assert x == 1", "demo");

        root = workspace.root();

        // The files cannot be unlinked from a read-only directory.
        std::filesystem::permissions(root, std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec);

        BOOST_CHECK(static_cast<bool>(workspaces.release(workspace)));
        BOOST_CHECK(!workspace.released());

        // The removal failure is reported on stderr, which is closed for the rest of the block.
        const auto saved_stderr = ::dup(STDERR_FILENO);
        BOOST_REQUIRE_NE(saved_stderr, -1);
        ::close(STDERR_FILENO);

        BOOST_CHECK_NO_THROW(workspace = workspaces.allocate());

        ::dup2(saved_stderr, STDERR_FILENO);
        ::close(saved_stderr);
    }

    BOOST_CHECK(std::filesystem::is_directory(root));
    BOOST_CHECK_EQUAL(count_entries(scratch.path()), 1U);

    std::filesystem::permissions(root, std::filesystem::perms::owner_all);
}
