#ifndef CONTRACTRUNNER_WORKSPACE_HPP
#define CONTRACTRUNNER_WORKSPACE_HPP

#include <chrono>       // std::chrono::system_clock
#include <filesystem>   // std::filesystem::path
#include <stdexcept>    // std::runtime_error
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::error_code

/**
 * @file
 * @brief Per-request directories holding the staged artifacts.
 */
namespace ContractRunner
{

/** Thrown when a workspace cannot be created or an artifact cannot be written into it. */
class StagingError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/** Where workspaces are created and how the staged files are named. */
struct workspace_layout
{
    /**
     * The directory under which every workspace is created. It is created if it does not
     * exist, and it is never removed.
     */
    std::filesystem::path temp_root;

    /** The extension of the contract file, whose stem is the sanitized entry name. */
    std::string contract_extension { ".py" };

    /**
     * The fixed name of the test file on the host. The default contains a `-`, which sanitized entry
     * names never do, so the contract file cannot take its place.
     */
    std::string test_filename { "test-contract.py" };
};

class WorkspaceManager;

/**
 * A uniquely named directory owned by a single request.
 *
 * The directory is removed when the object is destroyed, unless WorkspaceManager::release
 * has already done it. Workspaces can be moved but not copied, so exactly one owner is
 * responsible for the removal.
 */
class Workspace
{
public:
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;

    ~Workspace();

    /** The absolute path of the directory. */
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

    /** The path of the contract file. Empty until WorkspaceManager::place is called. */
    [[nodiscard]] const std::filesystem::path& contract_file() const noexcept { return m_contract_file; }

    /** The path of the test file. */
    [[nodiscard]] const std::filesystem::path& test_file() const noexcept { return m_test_file; }

    /** When the directory was created. */
    [[nodiscard]] std::chrono::system_clock::time_point created_at() const noexcept { return m_created_at; }

    /** The name of the directory, which is unique among all the live workspaces. */
    [[nodiscard]] std::string name() const { return m_root.filename().string(); }

    /** Whether the directory has already been removed. */
    [[nodiscard]] bool released() const noexcept { return m_released; }

private:
    friend class WorkspaceManager;

    Workspace(std::filesystem::path root, std::filesystem::path test_file, std::chrono::system_clock::time_point created_at) noexcept;

    std::error_code remove() noexcept;

    std::filesystem::path m_root;
    std::filesystem::path m_contract_file;
    std::filesystem::path m_test_file;
    std::chrono::system_clock::time_point m_created_at;
    bool m_released { false };
};

/** Allocates, fills and removes workspaces. */
class WorkspaceManager
{
public:
    explicit WorkspaceManager(workspace_layout layout);

    /**
     * Creates a new directory under the temp root, named after a nanosecond timestamp and a random token.
     *
     * @throws StagingError if the temp root or the directory cannot be created.
     */
    [[nodiscard]] Workspace allocate() const;

    /**
     * Writes the artifacts verbatim into the workspace. The contract file is named after the sanitized
     * entry name, the test file has a fixed name.
     *
     * @throws StagingError if any of the files already exists or cannot be written.
     * @throws ValidationError if the entry name is not valid.
     */
    void place(Workspace& workspace, std::string_view contract_code, std::string_view test_code, std::string_view entry_name) const;

    /**
     * Recursively removes the workspace. Calling it more than once, or on a directory that no longer
     * exists, is not an error.
     *
     * @return the error that prevented the removal, if any. It is never thrown.
     */
    std::error_code release(Workspace& workspace) const noexcept;

    [[nodiscard]] const workspace_layout& layout() const noexcept { return m_layout; }

private:
    workspace_layout m_layout;
};

} // namespace ContractRunner

#endif
