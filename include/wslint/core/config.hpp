#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace wslint {

// Effective formatting rules for one file. Treated as an immutable value:
// overrides produce a new Config instead of modifying a shared one.
struct Config {
    bool expand_tabs = false;
    size_t tab_size = 4;
    size_t line_length = 80;

    auto operator==(const Config& other) const -> bool = default;
};

// Apply modeline tokens on top of base, left to right:
//   "et"    -> expand_tabs = true
//   "noet"  -> expand_tabs = false
//   "ts=N"  -> tab_size = N, ignored unless N is a positive integer
//              (one leading '+' allowed)
// Unknown tokens are ignored.
auto resolve_config(const Config& base, std::string_view modeline) -> Config;

// Strict positive decimal: no sign, no whitespace, no trailing characters
auto parse_positive(std::string_view text) -> std::optional<size_t>;

} // namespace wslint
