#ifndef CONTRACTRUNNER_REQUEST_HPP
#define CONTRACTRUNNER_REQUEST_HPP

#include <cstddef>     // std::size_t
#include <stdexcept>   // std::runtime_error
#include <string>      // std::string
#include <string_view> // std::string_view

/**
 * @file
 * @brief The request and response types of an execution, and the validation of requests.
 */
namespace ContractRunner
{

/** Thrown when a request is missing a field or one of its fields is malformed. */
class ValidationError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/** The maximum length of an entry name. */
inline constexpr std::size_t max_entry_name_length { 64 };

/** A single request to run a contract against its tests. */
struct ExecutionRequest
{
    /** The source of the contract. Written verbatim into the workspace. */
    std::string contract_code;

    /** The source of the tests. Written verbatim into the workspace. */
    std::string test_code;

    /**
     * The name of the entry, which is used for naming the contract file, both inside the
     * workspace and inside the sandbox.
     */
    std::string entry_name;
};

/** What is sent back to the caller. */
struct Response
{
    /** HTTP-style status code: 200, 400 or 500. */
    unsigned int status_code;

    /** The body of the response. */
    std::string body;

    /** The media type of the body. */
    std::string content_type { "text/plain; charset=utf-8" };
};

/**
 * Checks that every field of the request is present and well-formed.
 *
 * @param request the request to check.
 * @param max_artifact_size the maximum size in bytes of each artifact. If zero, there is no limit.
 *
 * @throws ValidationError listing every missing field, or describing the first malformed one.
 */
void validate(const ExecutionRequest& request, std::size_t max_artifact_size);

/**
 * Checks if the entry name can be used as a path component and as a single command-line token:
 * ASCII letters, digits, `_` and `-` only, not starting with a digit, and at most
 * \ref max_entry_name_length characters.
 */
[[nodiscard]] bool is_valid_entry_name(std::string_view entry_name) noexcept;

/**
 * Normalizes a valid entry name into an identifier: lowercase, with every `-` replaced by `_`.
 *
 * @throws ValidationError if the entry name is not valid.
 */
[[nodiscard]] std::string sanitize_entry_name(std::string_view entry_name);

} // namespace ContractRunner

#endif
