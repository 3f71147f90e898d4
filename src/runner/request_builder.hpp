#pragma once

#include "runner/retrying_invoker.hpp"
#include "runner/spec_resolver.hpp"

#include <testconsole/framework/runner.hpp>

#include <memory>
#include <vector>

namespace testconsole {

/// Turns resolved units into requests for the scheduler.
///
/// Class units are combined into a single suite request, unless ``request_per_class`` is set, in
/// which case each gets its own. Every method unit always gets its own request.
std::vector<Request> build_requests(const ResolvedSpecs& specs, const std::shared_ptr<const RetryingInvoker>& invoker,
                                    bool request_per_class);

} // namespace testconsole
