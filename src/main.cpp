#include <cstdlib>   // EXIT_FAILURE
#include <exception> // std::exception
#include <iostream>  // std::cerr
#include <print>     // std::println
#include <span>      // std::span

#include <contractrunner/arguments.hpp> // parse_arguments
#include <contractrunner/logging.hpp>   // logging::color_support::check, logging::code, logging::Color, logging::OutputType, logging::Style

int main(int argc, const char** argv)
{
    try
    {
        logging::color_support::check();

        return parse_arguments(std::span { argv, argv + argc });
    }
    catch (const std::exception& e)
    {
        std::println(std::cerr, "{}{}Error{}: {:s}", logging::code<logging::OutputType::StandardError>(logging::Style::Bold), logging::code<logging::OutputType::StandardError>(logging::Color::Red), logging::code<logging::OutputType::StandardError>(logging::Style::Reset), e.what());

        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::println(std::cerr, "{}{}Unknown error{}", logging::code<logging::OutputType::StandardError>(logging::Style::Bold), logging::code<logging::OutputType::StandardError>(logging::Color::Red), logging::code<logging::OutputType::StandardError>(logging::Style::Reset));

        return EXIT_FAILURE;
    }
}
