#include "wslint/core/line.hpp"
#include <array>

namespace wslint {

auto split_line(std::string_view line) -> SplitLine {
    if (line.ends_with("\r\n")) {
        return {.content = line.substr(0, line.size() - 2), .ending = LineEnding::CRLF};
    }
    if (line.ends_with('\n')) {
        return {.content = line.substr(0, line.size() - 1), .ending = LineEnding::LF};
    }
    if (line.ends_with('\r')) {
        return {.content = line.substr(0, line.size() - 1), .ending = LineEnding::CR};
    }
    return {.content = line, .ending = LineEnding::NONE};
}

auto ending_text(LineEnding ending) -> std::string_view {
    switch (ending) {
    case LineEnding::LF:
        return "\n";
    case LineEnding::CR:
        return "\r";
    case LineEnding::CRLF:
        return "\r\n";
    case LineEnding::NONE:
        return "";
    }
    return "";
}

auto trailing_blank_size(std::string_view content) -> size_t {
    if (content.empty()) {
        return 0;
    }

    switch (content.back()) {
    case ' ':
    case '\t':
    case '\v':
    case '\f':
        return 1;
    default:
        break;
    }

    // Multi-byte members of White_Space
    static constexpr std::array<std::string_view, 19> wide_blanks = {
        "\xC2\x85",     // U+0085 next line
        "\xC2\xA0",     // U+00A0 no-break space
        "\xE1\x9A\x80", // U+1680 ogham space mark
        "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85",
        "\xE2\x80\x86", "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", // U+2000..U+200A
        "\xE2\x80\xA8", // U+2028 line separator
        "\xE2\x80\xA9", // U+2029 paragraph separator
        "\xE2\x80\xAF", // U+202F narrow no-break space
        "\xE2\x81\x9F", // U+205F medium mathematical space
        "\xE3\x80\x80", // U+3000 ideographic space
    };

    for (auto blank : wide_blanks) {
        if (content.ends_with(blank)) {
            return blank.size();
        }
    }
    return 0;
}

} // namespace wslint
