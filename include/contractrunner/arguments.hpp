#ifndef CONTRACTRUNNER_ARGUMENTS_HPP
#define CONTRACTRUNNER_ARGUMENTS_HPP

#include <span>      // std::span
#include <stdexcept> // std::runtime_error

/**
 * @file
 * @brief Argument handling.
 */

/** Thrown when an unrecognized or malformed argument is detected. */
class BadArgument : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * Parses the arguments given through `argv` and runs the selected command.
 *
 * @return the exit status of the command.
 */
int parse_arguments(std::span<const char* const> argv);

#endif
