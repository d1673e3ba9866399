#include <contractrunner/arguments.hpp>

#include <algorithm>    // std::max, std::ranges::find_if, std::ranges::max_element
#include <array>        // std::array
#include <charconv>     // std::from_chars
#include <chrono>       // std::chrono::seconds
#include <cstddef>      // std::size_t
#include <cstdint>      // std::uint64_t
#include <cstdlib>      // EXIT_SUCCESS
#include <filesystem>   // std::filesystem::exists, std::filesystem::path, std::filesystem::temp_directory_path
#include <format>       // std::format
#include <fstream>      // std::ifstream
#include <iostream>     // std::cerr
#include <limits>       // std::numeric_limits
#include <print>        // std::print, std::println
#include <ranges>       // std::views::filter, std::views::split
#include <span>         // std::span
#include <sstream>      // std::ostringstream
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::errc
#include <thread>       // std::thread::hardware_concurrency
#include <utility>      // std::move
#include <vector>       // std::vector

#include <boost/process/v2/environment.hpp> // boost::process::environment::find_executable

#include <build/config.hpp>                 // ContractRunner::config::executable_name, ContractRunner::config::project_fancy_name, ContractRunner::config::project_version
#include <contractrunner/execution_log.hpp> // ContractRunner::ExecutionLogger
#include <contractrunner/logging.hpp>       // logging::code, logging::color_support, logging::Color, logging::info, logging::output, logging::path_to_utf8, logging::Style
#include <contractrunner/orchestrator.hpp>  // ContractRunner::Orchestrator, ContractRunner::orchestrator_args
#include <contractrunner/request.hpp>       // ContractRunner::ExecutionRequest
#include <contractrunner/sandbox.hpp>       // ContractRunner::sandbox_args, ContractRunner::SandboxInvoker, ContractRunner::SandboxOperationalError
#include <contractrunner/server.hpp>        // ContractRunner::Server, ContractRunner::server_args
#include <contractrunner/workspace.hpp>     // ContractRunner::workspace_layout, ContractRunner::WorkspaceManager

namespace
{

using command_pointer = int (*)(std::span<const std::string_view>);

using namespace std::string_view_literals;

constexpr auto separator_arguments { ',' };

#define DEFAULT_TIMEOUT_S 60
#define DEFAULT_PORT 3001

constexpr std::uint64_t default_n_jobs { 0 }; // One job per hardware thread.
constexpr std::uint64_t default_max_artifact_size { 1024 * 1024 };

// Room for the JSON framing and the entry name around the two artifacts.
constexpr std::uint64_t body_overhead { 64 * 1024 };

constexpr auto default_address { "127.0.0.1"sv };
constexpr auto default_runtime { "docker"sv };
constexpr auto default_image { "obiyankenobi/hathor-core-test-image"sv };
constexpr auto default_contract_directory { "/app/hathor/nanocontracts/blueprints"sv };
constexpr auto default_test_path { "/app/tests/nanocontracts/test_contract.py"sv };
constexpr auto default_entry_point { "pytest"sv };
constexpr auto default_log_file { "execution.log"sv };
constexpr auto default_temp_directory { "contractrunner"sv };

constexpr unsigned int status_ok { 200 };
constexpr unsigned int status_bad_request { 400 };

struct Option
{
    const std::string_view name;
    const std::string_view short_name;
    const std::string_view help;
};

struct Command
{
    Option option;
    const command_pointer operation;
    std::span<const Option> options;

    bool is_hidden { false };

    [[nodiscard]] constexpr bool is_option() const noexcept { return option.name.starts_with("--"); };
};

[[nodiscard]] constexpr auto operator==(const Option& option, std::string_view rhs) noexcept
{
    return option.name == rhs || (!option.short_name.empty() && option.short_name == rhs);
}

int serve(std::span<const std::string_view> arguments);
int run(std::span<const std::string_view> arguments);
int help_subcommand(std::span<const std::string_view> arguments);

constexpr Option option_help {
    .name = "--help",
    .short_name = "-h",
    .help = "Print this message or the help of the given subcommand",
};

constexpr Option option_color {
    .name = "--color",
    .short_name = "-c",
    .help = R"(Enables color output with "true" or disables it with "false". By default it's automatic)",
};

constexpr Option option_address {
    .name = "--address",
    .short_name = "-a",
    .help = "The address to listen on. By default it's 127.0.0.1"
};

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)
#define DEFAULT_TIMEOUT_STR TOSTRING(DEFAULT_TIMEOUT_S)
#define DEFAULT_PORT_STR TOSTRING(DEFAULT_PORT)

constexpr Option option_port {
    .name = "--port",
    .short_name = "-p",
    .help = "The port to listen on. A value of 0 picks a free port. By default it's " DEFAULT_PORT_STR
};

constexpr Option option_timeout {
    .name = "--timeout",
    .short_name = "-t",
    .help = "Sandbox timeout in seconds. By default it's " DEFAULT_TIMEOUT_STR " seconds"
};

#undef DEFAULT_PORT_STR
#undef DEFAULT_TIMEOUT_STR
#undef TOSTRING
#undef STRINGIFY

constexpr Option option_jobs {
    .name = "--jobs",
    .short_name = "-j",
    .help = "The maximum number of concurrent executions. A value of 0 (which is the default) uses one per hardware thread"
};

constexpr Option option_temp_root {
    .name = "--temp-root",
    .short_name = {},
    .help = "The directory under which the workspaces are created. By default it's `contractrunner` inside the system's temporary directory"
};

constexpr Option option_log_file {
    .name = "--log-file",
    .short_name = "-l",
    .help = "The file the execution records are appended to. By default it's `execution.log`"
};

constexpr Option option_runtime {
    .name = "--runtime",
    .short_name = "-r",
    .help = "The path of the container runtime. By default it's `docker`"
};

constexpr Option option_image {
    .name = "--image",
    .short_name = "-i",
    .help = "The image the sandbox is created from"
};

constexpr Option option_contract_directory {
    .name = "--contract-dir",
    .short_name = {},
    .help = "The directory inside the sandbox where the contract is mounted"
};

constexpr Option option_test_path {
    .name = "--test-path",
    .short_name = {},
    .help = "The path inside the sandbox where the test file is mounted"
};

constexpr Option option_entry_point {
    .name = "--entry-point",
    .short_name = "-e",
    .help = "The command run against the test file, as a comma-separated list of tokens. By default it's `pytest`"
};

constexpr Option option_workdir {
    .name = "--workdir",
    .short_name = "-w",
    .help = "The working directory inside the sandbox. By default it's the image's"
};

constexpr Option option_max_artifact_size {
    .name = "--max-artifact-size",
    .short_name = {},
    .help = "The maximum size in bytes of each artifact. A value of 0 removes the limit. By default it's 1 MiB"
};

constexpr Option option_memory {
    .name = "--memory",
    .short_name = "-m",
    .help = "The memory limit of the sandbox, e.g. `512m`. By default there is none"
};

constexpr Option option_pids_limit {
    .name = "--pids-limit",
    .short_name = {},
    .help = "The maximum number of processes inside the sandbox. By default there is none"
};

constexpr Option option_contract {
    .name = "--contract",
    .short_name = "-C",
    .help = "The file with the contract code"
};

constexpr Option option_test {
    .name = "--test",
    .short_name = "-T",
    .help = "The file with the test code"
};

constexpr Option option_name {
    .name = "--name",
    .short_name = "-n",
    .help = "The entry name. By default it's the name of the contract file without its extension"
};

constexpr Option option_quiet {
    .name = "--quiet",
    .short_name = "-q",
    .help = "Do not report the progress on stderr"
};

constexpr std::array serve_parameters {
    option_help,
    option_color,
    option_address,
    option_port,
    option_jobs,
    option_temp_root,
    option_log_file,
    option_runtime,
    option_image,
    option_contract_directory,
    option_test_path,
    option_entry_point,
    option_workdir,
    option_timeout,
    option_max_artifact_size,
    option_memory,
    option_pids_limit
};

constexpr std::array run_parameters {
    option_help,
    option_color,
    option_contract,
    option_test,
    option_name,
    option_quiet,
    option_temp_root,
    option_log_file,
    option_runtime,
    option_image,
    option_contract_directory,
    option_test_path,
    option_entry_point,
    option_workdir,
    option_timeout,
    option_max_artifact_size,
    option_memory,
    option_pids_limit
};

constexpr Command command_serve {
    .option {
        .name = "serve",
        .short_name = {},
        .help = "Starts the HTTP service which runs contracts against their tests" },
    .operation = serve,
    .options = serve_parameters
};

constexpr Command command_run {
    .option {
        .name = "run",
        .short_name = {},
        .help = "Runs a single contract against its tests and prints the output" },
    .operation = run,
    .options = run_parameters
};

constexpr Command command_help {
    .option {
        .name = "help",
        .short_name = {},
        .help = "Print this message or the help of the given subcommand" },
    .operation = help_subcommand,
    .options = {}
};

constexpr Command command_help_option {
    .option = option_help,
    .operation = nullptr,
    .options = {}
};

constexpr Command command_version {
    .option {
        .name = "--version",
        .short_name = "-v",
        .help = "Prints the version" },
    .operation = nullptr,
    .options = {}
};

constexpr Command command_color_option {
    .option = option_color,
    .operation = nullptr,
    .options = {}
};

constexpr std::array commands {
    command_serve,
    command_run,
    command_help,
    command_help_option,
    command_version,
    command_color_option
};

/** The settings shared by every command that runs the sandbox. */
struct pipeline_settings
{
    std::string_view temp_root;
    std::string_view log_file { default_log_file };
    std::string_view runtime { default_runtime };
    std::string_view image { default_image };
    std::string_view contract_directory { default_contract_directory };
    std::string_view test_path { default_test_path };
    std::string_view entry_point { default_entry_point };
    std::string_view working_directory;
    std::string_view memory_limit;
    std::uint64_t pids_limit {};
    std::uint64_t timeout_seconds { DEFAULT_TIMEOUT_S };
    std::uint64_t max_artifact_size { default_max_artifact_size };
};

#undef DEFAULT_TIMEOUT_S

/** The components of the pipeline, wired together. */
struct Pipeline
{
    Pipeline(ContractRunner::workspace_layout layout, ContractRunner::sandbox_args args, const std::filesystem::path& log_file, std::size_t max_artifact_size) :
        workspaces { std::move(layout) },
        sandbox { std::move(args) },
        logger { log_file },
        orchestrator { ContractRunner::orchestrator_args {
            .workspaces = workspaces,
            .sandbox = sandbox,
            .logger = logger,
            .max_artifact_size = max_artifact_size } } { }

    ContractRunner::WorkspaceManager workspaces;
    ContractRunner::SandboxInvoker sandbox;
    ContractRunner::ExecutionLogger logger;
    ContractRunner::Orchestrator orchestrator;
};

std::string_view next_parameter(std::span<const std::string_view> arguments, std::size_t& i, const Option& option)
{
    if (i + 1 >= arguments.size())
        throw BadArgument { std::format("{:s}: {:s}: Missing parameter.", arguments.front(), option.name) };

    return arguments[++i];
}

template<typename T>
T parse_number(std::span<const std::string_view> arguments, std::size_t& i, const Option& option)
{
    const auto parameter { next_parameter(arguments, i, option) };

    T value {};
    const auto [end, ec] = std::from_chars(parameter.data(), parameter.data() + parameter.size(), value);

    if (ec == std::errc::result_out_of_range)
        throw BadArgument { std::format("{:s}: {:s}: The specified number is too big.", arguments.front(), option.name) };

    if (ec == std::errc::invalid_argument || end != parameter.data() + parameter.size())
        throw BadArgument { std::format("{:s}: {:s}: Invalid number `{:s}{:s}{:s}`.", arguments.front(), option.name, logging::code(logging::Color::Blue), parameter, logging::code(logging::Style::Reset)) };

    return value;
}

/**
 * Consumes the option at `arguments[i]` and its parameter if it's one of the pipeline settings.
 *
 * @return true if the option was consumed.
 */
bool parse_pipeline_option(std::span<const std::string_view> arguments, std::size_t& i, pipeline_settings& settings)
{
    const auto argument { arguments[i] };

    if (argument == option_temp_root)
        settings.temp_root = next_parameter(arguments, i, option_temp_root);
    else if (argument == option_log_file)
        settings.log_file = next_parameter(arguments, i, option_log_file);
    else if (argument == option_runtime)
        settings.runtime = next_parameter(arguments, i, option_runtime);
    else if (argument == option_image)
        settings.image = next_parameter(arguments, i, option_image);
    else if (argument == option_contract_directory)
        settings.contract_directory = next_parameter(arguments, i, option_contract_directory);
    else if (argument == option_test_path)
        settings.test_path = next_parameter(arguments, i, option_test_path);
    else if (argument == option_entry_point)
        settings.entry_point = next_parameter(arguments, i, option_entry_point);
    else if (argument == option_workdir)
        settings.working_directory = next_parameter(arguments, i, option_workdir);
    else if (argument == option_memory)
        settings.memory_limit = next_parameter(arguments, i, option_memory);
    else if (argument == option_pids_limit)
        settings.pids_limit = parse_number<std::uint64_t>(arguments, i, option_pids_limit);
    else if (argument == option_max_artifact_size)
        settings.max_artifact_size = parse_number<std::uint64_t>(arguments, i, option_max_artifact_size);
    else if (argument == option_timeout)
    {
        settings.timeout_seconds = parse_number<std::uint64_t>(arguments, i, option_timeout);

        if (settings.timeout_seconds == 0)
            throw BadArgument { std::format("{:s}: {:s}: The timeout must be at least one second.", arguments.front(), option_timeout.name) };
    }
    else
        return false;

    return true;
}

std::filesystem::path resolve_runtime(std::string_view command, std::string_view runtime)
{
    const std::filesystem::path executable_from_user { runtime };

    const auto executable = std::filesystem::exists(executable_from_user) ? executable_from_user : boost::process::environment::find_executable(executable_from_user);

    if (executable.empty())
        throw BadArgument { std::format("{:s}: Could not find the executable `{:s}{:s}{:s}`. Please add it to $PATH or provide its path using `{:s}{:s}{:s}`.", command, logging::code(logging::Color::Blue), executable_from_user.native(), logging::code(logging::Style::Reset), logging::code(logging::Color::Blue), option_runtime.name, logging::code(logging::Style::Reset)) };

    return executable;
}

std::vector<std::string> split_tokens(std::string_view list)
{
    std::vector<std::string> tokens;

    for (const auto token : std::views::split(list, separator_arguments))
        if (!token.empty())
            tokens.emplace_back(token.begin(), token.end());

    return tokens;
}

Pipeline make_pipeline(std::string_view command, const pipeline_settings& settings)
{
    ContractRunner::workspace_layout layout {
        .temp_root = settings.temp_root.empty() ? std::filesystem::temp_directory_path() / default_temp_directory : std::filesystem::path { settings.temp_root }
    };

    ContractRunner::sandbox_args args {
        .runtime = resolve_runtime(command, settings.runtime),
        .image = std::string { settings.image },
        .contract_directory = std::string { settings.contract_directory },
        .test_path = std::string { settings.test_path },
        .entry_point = split_tokens(settings.entry_point),
        .working_directory = std::string { settings.working_directory },
        .memory_limit = std::string { settings.memory_limit },
        .pids_limit = settings.pids_limit,
        .timeout = std::chrono::seconds { settings.timeout_seconds }
    };

    return Pipeline { std::move(layout), std::move(args), std::filesystem::path { settings.log_file }, static_cast<std::size_t>(settings.max_artifact_size) };
}

std::string read_file(std::string_view command, const Option& option, const std::filesystem::path& path)
{
    std::ifstream file { path, std::ios::binary };

    if (!file.is_open())
        throw BadArgument { std::format("{:s}: {:s}: Could not open the file `{:s}{:s}{:s}`.", command, option.name, logging::code(logging::Color::Blue), logging::path_to_utf8(path), logging::code(logging::Style::Reset)) };

    std::ostringstream ostringstream;
    ostringstream << file.rdbuf();

    return std::move(ostringstream).str();
}

int print_help()
{
    static constexpr auto largest_command = std::ranges::max_element(commands,
        {}, [](const Command& command)
        { return command.is_option() || command.is_hidden ? std::string_view::size_type {} : command.option.name.length(); })
                                                ->option.name.length();

    static constexpr auto largest_option = std::ranges::max_element(commands,
        {}, [](const Command& command)
        { return !command.is_option() ? std::string_view::size_type {} : command.option.name.length(); })
                                               ->option.name.length();

    std::println("{:s} runs untrusted contracts against their tests inside disposable containers.", ContractRunner::config::project_fancy_name);

    std::println("\n{0:}{1:}Usage{2:}: ./{3:s} [COMMAND]\n\n{0:}{1:}Commands{2:}:", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset), ContractRunner::config::executable_name);

    for (const auto& command : commands | std::views::filter([](const auto& command)
                                   { return !command.is_option() && !command.is_hidden; }))
        std::println("  {:<{}}  {}", command.option.name, largest_command, command.option.help);

    std::println("\n{}{}Options{}:", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset));
    for (const auto& option : commands | std::views::filter([](const auto& option)
                                  { return option.is_option() && !option.is_hidden; }))
        std::println("  {}, {:<{}}  {}", option.option.short_name, option.option.name, largest_option, option.option.help);

    return EXIT_SUCCESS;
}

int help_subcommand(const Command& command)
{
    std::println("{}", command.option.help);

    std::println("\n{:s}{:s}Usage{:s}: ./{:s} {:s} <ARGUMENTS>", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset), ContractRunner::config::executable_name, command.option.name);

    const auto largest_option = std::ranges::max_element(command.options,
        {}, [](const Option& option)
        { return option.name.length(); });

    if (largest_option != command.options.end())
    {
        const auto largest_option_length = largest_option->name.length();

        std::println("\n{:s}{:s}Options{:s}:", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset));
        for (const auto& option : command.options)
        {
            if (option.short_name.empty())
                std::println("      {:<{}}  {}", option.name, largest_option_length, option.help);
            else
                std::println("  {}, {:<{}}  {}", option.short_name, option.name, largest_option_length, option.help);
        }
    }

    return EXIT_SUCCESS;
}

int help_subcommand(std::span<const std::string_view> arguments)
{
    // No arguments, or asking for help for ourselves.
    if (arguments.size() == 1 || (arguments[1] == option_help || arguments[1] == arguments.front()))
        return print_help();

    if (arguments.size() > 2)
        throw BadArgument { std::format("{:s}: Too many arguments.", arguments.front()) };

    const auto* const command = std::ranges::find_if(commands, [subcommand = arguments.back()](const auto& command)
        { return command.option.name == subcommand; });

    if (command == commands.end())
        throw BadArgument { std::format("{:s}: Unknown command `{:s}{:s}{:s}`.", arguments.front(), logging::code(logging::Color::Blue), arguments.back(), logging::code(logging::Style::Reset)) };

    return help_subcommand(*command);
}

int serve(std::span<const std::string_view> arguments)
{
    pipeline_settings settings;

    std::string_view address { default_address };
    unsigned short port { DEFAULT_PORT };
    std::uint64_t n_jobs { default_n_jobs };

#undef DEFAULT_PORT

    for (std::size_t i { 1 }; i < arguments.size(); ++i)
    {
        if (parse_pipeline_option(arguments, i, settings))
            continue;

        if (arguments[i] == option_help)
            return help_subcommand(command_serve);

        if (arguments[i] == option_address)
            address = next_parameter(arguments, i, option_address);
        else if (arguments[i] == option_port)
            port = parse_number<unsigned short>(arguments, i, option_port);
        else if (arguments[i] == option_jobs)
            n_jobs = parse_number<std::uint64_t>(arguments, i, option_jobs);
        else
            throw BadArgument { std::format("{:s}: Unknown parameter `{:s}{:s}{:s}`.", arguments.front(), logging::code(logging::Color::Blue), arguments[i], logging::code(logging::Style::Reset)) };
    }

    if (n_jobs == 0)
        n_jobs = std::max(std::thread::hardware_concurrency(), 1U);

    const auto body_limit = settings.max_artifact_size == 0 || settings.max_artifact_size > (std::numeric_limits<std::uint64_t>::max() - body_overhead) / 2
        ? std::numeric_limits<std::uint64_t>::max()
        : settings.max_artifact_size * 2 + body_overhead;

    auto pipeline = make_pipeline(arguments.front(), settings);

    const ContractRunner::server_args args {
        .address = std::string { address },
        .port = port,
        .n_jobs = n_jobs,
        .body_limit = body_limit
    };

    ContractRunner::Server server { pipeline.orchestrator, args };

    logging::info("Serving with {:d} jobs, sandbox image `{:s}`, workspaces in `{:s}`.", n_jobs, pipeline.sandbox.args().image, logging::path_to_utf8(pipeline.workspaces.layout().temp_root));

    server.run();

    return EXIT_SUCCESS;
}

int run(std::span<const std::string_view> arguments)
{
    pipeline_settings settings;

    std::string_view contract_path;
    std::string_view test_path;
    std::string_view entry_name;
    bool quiet { false };

    for (std::size_t i { 1 }; i < arguments.size(); ++i)
    {
        if (parse_pipeline_option(arguments, i, settings))
            continue;

        if (arguments[i] == option_help)
            return help_subcommand(command_run);

        if (arguments[i] == option_contract)
            contract_path = next_parameter(arguments, i, option_contract);
        else if (arguments[i] == option_test)
            test_path = next_parameter(arguments, i, option_test);
        else if (arguments[i] == option_name)
            entry_name = next_parameter(arguments, i, option_name);
        else if (arguments[i] == option_quiet)
            quiet = true;
        else
            throw BadArgument { std::format("{:s}: Unknown parameter `{:s}{:s}{:s}`.", arguments.front(), logging::code(logging::Color::Blue), arguments[i], logging::code(logging::Style::Reset)) };
    }

    if (contract_path.empty())
        throw BadArgument { std::format("{:s}: Missing `{:s}{:s}{:s}`.", arguments.front(), logging::code(logging::Color::Blue), option_contract.name, logging::code(logging::Style::Reset)) };

    if (test_path.empty())
        throw BadArgument { std::format("{:s}: Missing `{:s}{:s}{:s}`.", arguments.front(), logging::code(logging::Color::Blue), option_test.name, logging::code(logging::Style::Reset)) };

    const std::filesystem::path contract_file { contract_path };

    const ContractRunner::ExecutionRequest request {
        .contract_code = read_file(arguments.front(), option_contract, contract_file),
        .test_code = read_file(arguments.front(), option_test, std::filesystem::path { test_path }),
        .entry_name = entry_name.empty() ? contract_file.stem().string() : std::string { entry_name }
    };

    auto output_log = quiet ? logging::output {} : logging::output { std::cerr };

    auto pipeline = make_pipeline(arguments.front(), settings);

    output_log.println("Running `{:s}{:s}{:s}` in `{:s}{:s}{:s}`...", logging::code<logging::OutputType::StandardError>(logging::Color::Blue), request.entry_name, logging::code<logging::OutputType::StandardError>(logging::Style::Reset), logging::code<logging::OutputType::StandardError>(logging::Color::Blue), pipeline.sandbox.args().image, logging::code<logging::OutputType::StandardError>(logging::Style::Reset));

    const auto response = pipeline.orchestrator.handle(request);

    pipeline.logger.flush();

    if (response.status_code == status_bad_request)
        throw BadArgument { std::format("{:s}: {:s}", arguments.front(), response.body) };

    if (response.status_code != status_ok)
        throw ContractRunner::SandboxOperationalError { std::format("{:s}: {:s}", arguments.front(), response.body) };

    std::print("{:s}", response.body);

    output_log.println("{:s}Done{:s}. The execution was recorded in `{:s}`.", logging::code<logging::OutputType::StandardError>(logging::Style::Bold), logging::code<logging::OutputType::StandardError>(logging::Style::Reset), logging::path_to_utf8(pipeline.logger.path()));

    return EXIT_SUCCESS;
}

int print_version()
{
    std::println("{:s} {:s}", ContractRunner::config::project_fancy_name, ContractRunner::config::project_version);

    if constexpr (ContractRunner::config::is_debug_build)
        std::println("\nDebug build.");

    return EXIT_SUCCESS;
}
}

int parse_arguments(std::span<const char* const> argv)
{
    if (argv.size() < 2)
        return print_help();

    std::vector<std::string_view> arguments;

    // Identify global toggles and remove them from the argument list.
    for (std::size_t i { 1 }; i < argv.size(); ++i)
    {
        const std::string_view argument { argv[i] };

        if (argument == option_help && arguments.empty())
            return print_help();

        if (argument == command_version.option)
            return print_version();

        if (argument == option_color)
        {
            if (i + 1 >= argv.size())
                throw BadArgument { std::format("{:s}: Missing parameter.", option_color.name) };

            const std::string_view value { argv[i + 1] };

            bool should_have_color = false;

            static constexpr auto value_true { "true"sv };
            static constexpr auto value_false { "false"sv };

            if (value == value_true)
                should_have_color = true;
            else if (value == value_false)
                should_have_color = false;
            else
                throw BadArgument { std::format(R"({:s}: Unknown value `{:s}{:s}{:s}`. Valid values are "{:s}" and "{:s}".)", option_color.name, logging::code(logging::Color::Blue), value, logging::code(logging::Style::Reset), value_true, value_false) };

            logging::color_support::set(should_have_color, should_have_color);

            ++i;
        }
        else
            arguments.emplace_back(argument);
    }

    const std::span arguments_span { arguments };

    for (std::size_t i {}; i < arguments_span.size(); ++i)
    {
        for (const auto& command : commands)
            if (arguments[i] == command.option)
                // The command's options will be handled by itself.
                return command.operation(arguments_span.subspan(i));

        // If we have reached this point, we have found an argument that does not match
        // our commands or our global arguments.
        throw BadArgument { std::format("Unknown command or option `{:s}{:s}{:s}`.", logging::code(logging::Color::Blue), arguments[i], logging::code(logging::Style::Reset)) };
    }

    // If we have reached this point, we have found no commands to execute.
    return print_help();
}
