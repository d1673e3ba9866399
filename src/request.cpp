#include <contractrunner/request.hpp>

#include <algorithm>   // std::ranges::all_of
#include <cstddef>     // std::size_t
#include <format>      // std::format
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include <contractrunner/logging.hpp> // logging::code, logging::Color, logging::Style

namespace
{

using namespace std::string_view_literals;

constexpr bool is_ascii_letter(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr bool is_ascii_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

constexpr char to_lower_ascii(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

void check_size(std::string_view field_name, std::string_view value, std::size_t max_artifact_size)
{
    if (max_artifact_size != 0 && value.size() > max_artifact_size)
        throw ContractRunner::ValidationError { std::format("Field `{:s}` is {:d} bytes long, the limit is {:d} bytes.", field_name, value.size(), max_artifact_size) };
}

}

namespace ContractRunner
{

void validate(const ExecutionRequest& request, std::size_t max_artifact_size)
{
    // The names are the ones callers use on the wire.
    std::vector<std::string_view> missing;

    if (request.contract_code.empty())
        missing.emplace_back("contractCode"sv);

    if (request.test_code.empty())
        missing.emplace_back("testCode"sv);

    if (request.entry_name.empty())
        missing.emplace_back("entryName"sv);

    if (!missing.empty())
    {
        std::string fields;

        for (const auto field : missing)
        {
            if (!fields.empty())
                fields += ", ";

            fields += field;
        }

        throw ValidationError { std::format("Missing required fields: {:s}", fields) };
    }

    if (!is_valid_entry_name(request.entry_name))
        throw ValidationError { std::format("Invalid entryName `{:s}`: only ASCII letters, digits, `_` and `-` are allowed, it cannot start with a digit and it must be at most {:d} characters long.", request.entry_name, max_entry_name_length) };

    check_size("contractCode"sv, request.contract_code, max_artifact_size);
    check_size("testCode"sv, request.test_code, max_artifact_size);
}

bool is_valid_entry_name(std::string_view entry_name) noexcept
{
    if (entry_name.empty() || entry_name.size() > max_entry_name_length || is_ascii_digit(entry_name.front()))
        return false;

    return std::ranges::all_of(entry_name, [](char c)
        { return is_ascii_letter(c) || is_ascii_digit(c) || c == '_' || c == '-'; });
}

std::string sanitize_entry_name(std::string_view entry_name)
{
    if (!is_valid_entry_name(entry_name))
        throw ValidationError { std::format("Invalid entry name `{:s}{:s}{:s}`.", logging::code(logging::Color::Blue), entry_name, logging::code(logging::Style::Reset)) };

    std::string sanitized;
    sanitized.reserve(entry_name.size());

    for (const auto c : entry_name)
        sanitized += c == '-' ? '_' : to_lower_ascii(c);

    return sanitized;
}

} // namespace ContractRunner
