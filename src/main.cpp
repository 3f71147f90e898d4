#include "app/console_runner.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <testconsole/logging.hpp>
#include <testconsole/registry/test_registry.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    testconsole::init_loggers();

    auto& registry = testconsole::TestRegistry::get();
    LOG_TRACE("Registered test classes: {}", registry.get_class_names());

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    testconsole::ProgramOptions options = testconsole::parse_args_or_exit(args);

    testconsole::ConsoleRunner runner{std::move(options), registry};

    return runner.run();
}
