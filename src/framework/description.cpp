#include <testconsole/framework/description.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace testconsole {

Description Description::create_suite(std::string name, std::vector<Description> children) {
    return Description{std::move(name), "", std::nullopt, std::move(children)};
}

Description Description::create_class(std::string class_name, std::vector<Description> children) {
    std::string display_name = class_name;
    return Description{std::move(display_name), std::move(class_name), std::nullopt, std::move(children)};
}

Description Description::create_test(std::string class_name, std::string method_name) {
    std::string display_name = fmt::format("{}({})", method_name, class_name);
    return Description{std::move(display_name), std::move(class_name), std::move(method_name), {}};
}

std::size_t Description::test_count() const noexcept {
    if (is_test()) {
        return 1;
    }

    return ranges::accumulate(children_ | ranges::views::transform(&Description::test_count), std::size_t{0});
}

bool Description::operator==(const Description& rhs) const {
    return display_name_ == rhs.display_name_ && class_name_ == rhs.class_name_ &&
           method_name_ == rhs.method_name_ && ranges::equal(children_, rhs.children_);
}

} // namespace testconsole
