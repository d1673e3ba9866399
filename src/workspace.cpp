#include <contractrunner/workspace.hpp>

#include <chrono>       // std::chrono::system_clock, std::chrono::nanoseconds
#include <cstdint>      // std::uint64_t
#include <exception>    // std::exception
#include <filesystem>   // std::filesystem::absolute, std::filesystem::create_directories, std::filesystem::create_directory, std::filesystem::exists, std::filesystem::path, std::filesystem::remove_all
#include <format>       // std::format
#include <fstream>      // std::ofstream
#include <random>       // std::mt19937_64, std::random_device
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::error_code
#include <utility>      // std::exchange, std::move

#include <contractrunner/logging.hpp> // logd, logging::code, logging::Color, logging::path_to_utf8, logging::Style, logging::warn
#include <contractrunner/request.hpp> // ContractRunner::sanitize_entry_name

namespace
{

constexpr auto max_allocation_attempts { 8 };

std::uint64_t random_token()
{
    thread_local std::mt19937_64 engine { std::random_device {}() };

    return engine();
}

void dump_file(const std::filesystem::path& path, std::string_view contents)
{
    if (std::filesystem::exists(path))
        throw ContractRunner::StagingError { std::format("The path `{:s}{:s}{:s}` already exists.", logging::code(logging::Color::Blue), logging::path_to_utf8(path), logging::code(logging::Style::Reset)) };

    std::ofstream file { path, std::ios::binary };

    if (!file.is_open())
        throw ContractRunner::StagingError { std::format(R"(Could not open the file `{:s}{:s}{:s}`.)", logging::code(logging::Color::Blue), logging::path_to_utf8(path), logging::code(logging::Style::Reset)) };

    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.close();

    if (file.fail())
        throw ContractRunner::StagingError { std::format(R"(Could not write to the file `{:s}{:s}{:s}`.)", logging::code(logging::Color::Blue), logging::path_to_utf8(path), logging::code(logging::Style::Reset)) };
}

/** Reports a workspace left behind. Reporting cannot fail the caller, which must not throw. */
void report_leftover(const std::filesystem::path& root, const std::error_code& error_code) noexcept
{
    try
    {
        logging::warn("Could not remove the workspace `{:s}`: {:s}", logging::path_to_utf8(root), error_code.message());
    }
    catch (const std::exception&)
    {
        // Nowhere left to report it.
    }
}

}

namespace ContractRunner
{

Workspace::Workspace(std::filesystem::path root, std::filesystem::path test_file, std::chrono::system_clock::time_point created_at) noexcept :
    m_root { std::move(root) }, m_test_file { std::move(test_file) }, m_created_at { created_at } { }

Workspace::Workspace(Workspace&& other) noexcept :
    m_root { std::move(other.m_root) },
    m_contract_file { std::move(other.m_contract_file) },
    m_test_file { std::move(other.m_test_file) },
    m_created_at { other.m_created_at },
    m_released { std::exchange(other.m_released, true) } { }

Workspace& Workspace::operator=(Workspace&& other) noexcept
{
    if (this == &other)
        return *this;

    if (const auto error_code = remove())
        report_leftover(m_root, error_code);

    m_root = std::move(other.m_root);
    m_contract_file = std::move(other.m_contract_file);
    m_test_file = std::move(other.m_test_file);
    m_created_at = other.m_created_at;
    m_released = std::exchange(other.m_released, true);

    return *this;
}

Workspace::~Workspace()
{
    if (const auto error_code = remove())
        report_leftover(m_root, error_code);
}

std::error_code Workspace::remove() noexcept
{
    if (m_released || m_root.empty())
        return {};

    std::error_code error_code;

    // remove_all does not report a path that is already gone.
    std::filesystem::remove_all(m_root, error_code);

    if (!error_code)
        m_released = true;

    return error_code;
}

WorkspaceManager::WorkspaceManager(workspace_layout layout) :
    m_layout { std::move(layout) } { }

Workspace WorkspaceManager::allocate() const
{
    std::error_code error_code;

    const auto temp_root = std::filesystem::absolute(m_layout.temp_root, error_code);

    if (error_code)
        throw StagingError { std::format("Could not resolve the temp root `{:s}{:s}{:s}`: {:s}", logging::code(logging::Color::Blue), logging::path_to_utf8(m_layout.temp_root), logging::code(logging::Style::Reset), error_code.message()) };

    std::filesystem::create_directories(temp_root, error_code);

    if (error_code)
        throw StagingError { std::format("Could not create the temp root `{:s}{:s}{:s}`: {:s}", logging::code(logging::Color::Blue), logging::path_to_utf8(temp_root), logging::code(logging::Style::Reset), error_code.message()) };

    for (auto attempt { 0 }; attempt < max_allocation_attempts; ++attempt)
    {
        const auto created_at = std::chrono::system_clock::now();
        const auto timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(created_at.time_since_epoch()).count();

        auto root = temp_root / std::format("{:d}_{:016x}", timestamp, random_token());

        // A non-recursive create reports an existing directory instead of sharing it.
        if (std::filesystem::create_directory(root, error_code))
        {
            logd("Allocated the workspace `{:s}`.", logging::path_to_utf8(root));

            auto test_file = root / m_layout.test_filename;

            return Workspace { std::move(root), std::move(test_file), created_at };
        }

        if (error_code)
            throw StagingError { std::format("Could not create the workspace `{:s}{:s}{:s}`: {:s}", logging::code(logging::Color::Blue), logging::path_to_utf8(root), logging::code(logging::Style::Reset), error_code.message()) };
    }

    throw StagingError { std::format("Could not find an unused workspace name after {:d} attempts.", max_allocation_attempts) };
}

void WorkspaceManager::place(Workspace& workspace, std::string_view contract_code, std::string_view test_code, std::string_view entry_name) const
{
    if (workspace.released())
        throw StagingError { "The workspace has already been released." };

    auto contract_file = workspace.root() / (sanitize_entry_name(entry_name) + m_layout.contract_extension);

    dump_file(contract_file, contract_code);
    workspace.m_contract_file = std::move(contract_file);

    dump_file(workspace.test_file(), test_code);
}

std::error_code WorkspaceManager::release(Workspace& workspace) const noexcept
{
    return workspace.remove();
}

} // namespace ContractRunner
