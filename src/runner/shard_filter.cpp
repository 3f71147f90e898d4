#include "runner/shard_filter.hpp"

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/runner.hpp>
#include <testconsole/logging.hpp>

#include <fmt/format.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace testconsole {

ShardFilter::ShardFilter(int shard_index, int shard_count)
    : shard_index_{shard_index}
    , shard_count_{shard_count} {
    if (shard_count <= 0 || shard_index < 0 || shard_index >= shard_count) {
        throw std::invalid_argument(
            fmt::format("0 <= M < N is required for test shard M/N, got {}/{}", shard_index, shard_count));
    }
}

bool ShardFilter::should_run(const Description& description) {
    if (description.is_suite()) {
        return true;
    }

    std::lock_guard lock{mutex_};

    if (auto iter = test_to_run_status_.find(description.get_display_name()); iter != test_to_run_status_.end()) {
        return iter->second;
    }

    const bool should_run = test_index_ % static_cast<std::size_t>(shard_count_) == static_cast<std::size_t>(shard_index_);
    LOG_TRACE("Shard decision #{} for {}: {}", test_index_, description, should_run);
    ++test_index_;
    test_to_run_status_.emplace(description.get_display_name(), should_run);

    return should_run;
}

std::string ShardFilter::describe() const {
    return fmt::format("Filters a static subset of test methods (shard {}/{})", shard_index_, shard_count_);
}

void apply_shard_filter(std::vector<Request>& requests, const std::shared_ptr<ShardFilter>& filter) {
    const DescriptionOrder alphabetic = [](const Description& lhs, const Description& rhs) {
        return lhs.get_display_name() < rhs.get_display_name();
    };

    for (Request& request : requests) {
        request.runner->sort(alphabetic);
        request.runner->filter(filter);
    }

    // Iterates over all of the tests serially, making every shard decision up front.
    // Needed to guarantee stable sharding once tests run in parallel.
    std::size_t num_selected = 0;
    for (Request& request : requests) {
        num_selected += request.runner->get_description().test_count();
    }

    LOG_DEBUG("Shard {}/{} selected {} tests", filter->get_shard_index(), filter->get_shard_count(), num_selected);
}

} // namespace testconsole
