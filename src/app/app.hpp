#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <testconsole/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace testconsole {

class App : NonCopyable
{
public:
    /// Exit code when the run was ended by an unhandled exception
    static constexpr int UNHANDLED_EXCEPTION_EXIT_CODE = -1;

    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(UNHANDLED_EXCEPTION_EXIT_CODE);
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace testconsole
