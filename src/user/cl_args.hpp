#pragma once

#include "user/program_options.hpp"

#include <testconsole/common/expected.hpp>

#include <argparse/argparse.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace testconsole {

/// Exit code for invalid command lines, given before any test has run
constexpr int USAGE_ERROR_EXIT_CODE = 1;

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed program options structure
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

    /// Replace every ``@file`` argument by the whitespace separated arguments within that file
    static Expected<std::vector<std::string>, std::string> expand_arg_files(const std::vector<std::string>& args);

    /// Parses ``M/N``
    static TestShard parse_test_shard(std::string_view str);

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

private:
    /// Set up the ArgumentParser for fields of ProgramOptions
    void setup_parser();

    argparse::ArgumentParser arg_parser_;
    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};
};

/// Parse the command line, or print the error and usage to stderr and exit with USAGE_ERROR_EXIT_CODE
ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = USAGE_ERROR_EXIT_CODE) noexcept;

} // namespace testconsole
