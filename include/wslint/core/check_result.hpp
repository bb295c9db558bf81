#pragma once

#include <cstddef>

namespace wslint {

// Violation counts for a line or a whole file. Sums pointwise; {0, 0} is the identity.
struct CheckResult {
    size_t fixable{};
    size_t unfixable{};

    auto operator==(const CheckResult& other) const -> bool = default;

    auto operator+=(const CheckResult& other) -> CheckResult&
    {
        fixable += other.fixable;
        unfixable += other.unfixable;
        return *this;
    }

    auto clean() const -> bool { return fixable == 0 && unfixable == 0; }
};

inline auto operator+(CheckResult lhs, const CheckResult& rhs) -> CheckResult
{
    lhs += rhs;
    return lhs;
}

} // namespace wslint
