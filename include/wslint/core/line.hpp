#pragma once

#include "wslint/types.hpp"
#include <string_view>

namespace wslint {

// A line split into its content and its terminator
struct SplitLine {
    std::string_view content;
    LineEnding ending = LineEnding::NONE;
};

auto split_line(std::string_view line) -> SplitLine;

// "\n", "\r", "\r\n" or ""
auto ending_text(LineEnding ending) -> std::string_view;

// Byte length of the Unicode White_Space code point (UTF-8) that ends
// content, or 0 if content does not end in whitespace.
// \r and \n never appear inside content.
auto trailing_blank_size(std::string_view content) -> size_t;

} // namespace wslint
