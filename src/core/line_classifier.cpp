#include "wslint/core/line_classifier.hpp"
#include "wslint/core/line.hpp"
#include <algorithm>

namespace wslint::core {

auto has_tab(std::string_view content) -> bool {
    return content.find('\t') != std::string_view::npos;
}

auto has_tab_after_content(std::string_view content) -> bool {
    // Leading tabs are indentation; a tab after the first other character is ambiguous
    auto first_other = content.find_first_not_of('\t');
    if (first_other == std::string_view::npos) {
        return false;
    }
    return content.find('\t', first_other) != std::string_view::npos;
}

auto has_trailing_whitespace(std::string_view content) -> bool {
    return trailing_blank_size(content) > 0;
}

auto visible_length(std::string_view content, size_t tab_size) -> size_t {
    auto tabs = static_cast<size_t>(std::count(content.begin(), content.end(), '\t'));
    auto extra_per_tab = tab_size > 0 ? tab_size - 1 : 0;
    return content.size() + tabs * extra_per_tab;
}

auto classify_line(const Config& config, std::string_view line) -> CheckResult {
    CheckResult result;
    auto [content, ending] = split_line(line);

    if (config.expand_tabs) {
        if (has_tab(content)) {
            result.fixable++;
        }
    } else if (has_tab_after_content(content)) {
        result.unfixable++;
    }

    if (ending == LineEnding::CR || ending == LineEnding::CRLF) {
        result.fixable++;
    }

    if (has_trailing_whitespace(content)) {
        result.fixable++;
    }

    if (visible_length(content, config.tab_size) > config.line_length) {
        result.unfixable++;
    }

    return result;
}

} // namespace wslint::core
