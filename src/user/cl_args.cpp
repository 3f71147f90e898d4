#include "user/cl_args.hpp"

#include "user/program_options.hpp"

#include <testconsole/common/error_types.hpp>
#include <testconsole/common/expected.hpp>
#include <testconsole/logging.hpp>
#include <testconsole/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace testconsole {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), std::string{VERSION_STRING}, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

int parse_int(std::string_view str, std::string_view arg_name) {
    int value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        throw std::invalid_argument(fmt::format("{} expects an integer, got {:?}", arg_name, str));
    }

    return value;
}

} // namespace

TestShard CommandLineArgs::parse_test_shard(std::string_view str) {
    constexpr std::string_view FORM_ERROR = "-test-shard should be in the form M/N";

    const auto slash_idx = str.find('/');
    if (slash_idx == std::string_view::npos) {
        throw std::invalid_argument(fmt::format("{} (got {:?})", FORM_ERROR, str));
    }

    TestShard shard;
    try {
        shard.index = parse_int(str.substr(0, slash_idx), "-test-shard");
        shard.count = parse_int(str.substr(slash_idx + 1), "-test-shard");
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(fmt::format("{} (got {:?})", FORM_ERROR, str));
    }

    if (shard.index < 0 || shard.count <= 0 || shard.index >= shard.count) {
        throw std::invalid_argument(fmt::format("0 <= M < N is required in -test-shard M/N (got {:?})", str));
    }

    return shard;
}

void CommandLineArgs::setup_parser() {
    arg_parser_.add_description(fmt::format("testconsole v{}\nRuns test classes and test methods, with output "
                                            "capture, XML reports, sharding, parallelism and retries.",
                                            VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("tests")
        .nargs(argparse::nargs_pattern::at_least_one)
        .metavar("TESTS")
        .help("Names of test classes or test methods (Class#method) to run. Names prefixed with @ are "
              "considered arg file paths, and the whitespace delimited arguments found inside are added to the list");

    arg_parser_.add_argument("-fail-fast")
        .store_into(opts_buffer_.fail_fast)
        .help("Causes the test suite run to fail fast.");

    arg_parser_.add_argument("-suppress-output")
        .store_into(opts_buffer_.suppress_output)
        .help("Suppresses test output.");

    arg_parser_.add_argument("-xmlreport")
        .store_into(opts_buffer_.xml_report)
        .help("Create ant compatible junit xml report files in -outdir.");

    arg_parser_.add_argument("-outdir")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.outdir = opt;
        })
        .help("Directory to output test captures to. Only used if -suppress-output or -xmlreport is set. "
              "Defaults to the system temporary directory.");

    arg_parser_.add_argument("-per-test-timer")
        .store_into(opts_buffer_.per_test_timer)
        .help("Show progress and timer for each test class.");

    arg_parser_.add_argument("-default-parallel")
        .store_into(opts_buffer_.default_parallel)
        .help("Whether to run test classes without a parallel or serial marker in parallel.");

    arg_parser_.add_argument("-parallel-threads")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                int parallel_threads = parse_int(opt, "-parallel-threads");

                if (parallel_threads < 0) {
                    throw std::invalid_argument("-parallel-threads cannot be negative");
                }

                if (parallel_threads == 0) {
                    const auto available_processors = static_cast<int>(std::max(1U, std::thread::hardware_concurrency()));
                    parallel_threads = available_processors;
                    fmt::print(stderr, "Auto-detected {} processors, using -parallel-threads={}\n",
                               available_processors, parallel_threads);
                }

                opts_buffer_.parallel_threads = parallel_threads;
        })
        .help("Number of threads to execute tests in parallel. Must be positive, or 0 to set automatically.");

    arg_parser_.add_argument("-test-shard")
        .metavar("M/N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.test_shard = parse_test_shard(opt);
        })
        .help("Subset of tests to run, in the form M/N, 0 <= M < N. For example, 1/3 means "
              "run tests number 2, 5, 8, 11, ...");

    arg_parser_.add_argument("-num-retries")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                const int num_retries = parse_int(opt, "-num-retries");

                if (num_retries < 0) {
                    throw std::invalid_argument("-num-retries cannot be negative");
                }

                opts_buffer_.num_retries = num_retries;
        })
        .help("Number of attempts to retry each failing test, 0 by default");

    arg_parser_.add_argument("-color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors in console output")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<std::vector<std::string>, std::string>
CommandLineArgs::expand_arg_files(const std::vector<std::string>& args) {
    std::vector<std::string> expanded;

    for (const std::string& arg : args) {
        if (!arg.starts_with('@')) {
            expanded.push_back(arg);
            continue;
        }

        const std::string path = arg.substr(1);
        std::ifstream arg_file{path};

        if (!arg_file) {
            return fmt::format("Failed to load args from arg file {}: {}", arg, get_err_msg());
        }

        std::string word;
        while (arg_file >> word) {
            expanded.push_back(word);
        }

        if (arg_file.bad()) {
            return fmt::format("Failed to load args from arg file {}: {}", arg, get_err_msg());
        }

        LOG_DEBUG("Loaded args from arg file {}", arg);
    }

    return expanded;
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    opts_buffer_.tests = TRY(expand_arg_files(arg_parser_.get<std::vector<std::string>>("tests")));

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace testconsole
