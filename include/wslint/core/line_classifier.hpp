#pragma once

#include "wslint/core/check_result.hpp"
#include "wslint/core/config.hpp"
#include <string_view>

namespace wslint::core {

// Predicates over line content (terminator already removed). The fixer
// reuses these so detection and correction never disagree.
auto has_tab(std::string_view content) -> bool;
auto has_tab_after_content(std::string_view content) -> bool;
auto has_trailing_whitespace(std::string_view content) -> bool;

// Column width of content with each tab counted as tab_size columns
auto visible_length(std::string_view content, size_t tab_size) -> size_t;

// Count the violations in one raw line (terminator included). Pure.
auto classify_line(const Config& config, std::string_view line) -> CheckResult;

} // namespace wslint::core
