#pragma once

#include <testconsole/framework/description.hpp>
#include <testconsole/framework/runner.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace testconsole {

/// Selects every ``shard_count``-th test, starting at ``shard_index``, in the order tests are first seen.
///
/// The same test may be queried many times (once per description computation, again when it runs,
/// possibly from a worker thread). Its decision is made exactly once, on the first query, and
/// memoized by display name. Suites always pass.
class ShardFilter final : public Filter
{
public:
    /// Throws std::invalid_argument unless 0 <= shard_index < shard_count
    ShardFilter(int shard_index, int shard_count);

    bool should_run(const Description& description) override;

    std::string describe() const override;

    int get_shard_index() const noexcept { return shard_index_; }
    int get_shard_count() const noexcept { return shard_count_; }

private:
    int shard_index_;
    int shard_count_;

    std::mutex mutex_;
    std::size_t test_index_{};
    std::unordered_map<std::string, bool> test_to_run_status_;
};

/// Sorts every request alphabetically by display name, attaches ``filter`` to it, then walks every
/// request's description once, serially and in order, so that every shard decision is made before
/// any test can be dispatched to a worker.
void apply_shard_filter(std::vector<Request>& requests, const std::shared_ptr<ShardFilter>& filter);

} // namespace testconsole
