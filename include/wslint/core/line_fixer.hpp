#pragma once

#include "wslint/core/config.hpp"
#include "wslint/interfaces.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wslint::core {

// Tag vocabulary, in the order the fixer applies them
inline constexpr std::string_view TAG_MAC_ENDING = "fixed mac line ending";
inline constexpr std::string_view TAG_WINDOWS_ENDING = "fixed windows line ending";
inline constexpr std::string_view TAG_EXPANDED_TABS = "expanded tabs";
inline constexpr std::string_view TAG_TABS_AFTER_OTHER = "tabs after other characters";
inline constexpr std::string_view TAG_TRAILING_WHITESPACE = "removed whitespace from end";
inline constexpr std::string_view TAG_LINE_TOO_LONG = "line too long";

// Result of fixing one line. Unchanged lines borrow the caller's buffer,
// so the input must outlive the FixedLine.
struct FixedLine {
    std::variant<std::string_view, std::string> text;
    std::vector<std::string_view> tags;

    auto view() const -> std::string_view;
    auto modified() const -> bool { return std::holds_alternative<std::string>(text); }
};

// Pure correction of one raw line
auto fix_line(const Config& config, std::string_view line) -> FixedLine;

// Same, and reports "<filename>:<line_number>: <tags>" when any tag fired
auto fix_line(const Config& config, const std::string& filename, size_t line_number,
              std::string_view line, IReporter& reporter) -> FixedLine;

} // namespace wslint::core
