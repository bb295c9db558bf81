#include "wslint/core/line_fixer.hpp"
#include "wslint/core/line.hpp"
#include "wslint/core/line_classifier.hpp"

namespace wslint::core {

auto FixedLine::view() const -> std::string_view {
    if (auto borrowed = std::get_if<std::string_view>(&text)) {
        return *borrowed;
    }
    return std::get<std::string>(text);
}

auto fix_line(const Config& config, std::string_view line) -> FixedLine {
    // Fast path: nothing to report, hand the caller's bytes straight back
    if (classify_line(config, line).clean()) {
        return FixedLine{.text = line, .tags = {}};
    }

    auto [content, ending] = split_line(line);
    std::vector<std::string_view> tags;
    std::string text(content);

    // 1. Line ending: one normalization over the single classification
    switch (ending) {
    case LineEnding::CR:
        tags.push_back(TAG_MAC_ENDING);
        ending = LineEnding::LF;
        break;
    case LineEnding::CRLF:
        tags.push_back(TAG_WINDOWS_ENDING);
        ending = LineEnding::LF;
        break;
    case LineEnding::LF:
    case LineEnding::NONE:
        break;
    }

    // 2./3. Tabs
    if (config.expand_tabs && has_tab(text)) {
        std::string expanded;
        expanded.reserve(visible_length(text, config.tab_size));
        for (char c : text) {
            if (c == '\t') {
                expanded.append(config.tab_size, ' ');
            } else {
                expanded.push_back(c);
            }
        }
        text = std::move(expanded);
        tags.push_back(TAG_EXPANDED_TABS);
    } else if (!config.expand_tabs && has_tab_after_content(text)) {
        tags.push_back(TAG_TABS_AFTER_OTHER);
    }

    // 4. Trailing whitespace, possibly back to an empty line
    if (has_trailing_whitespace(text)) {
        while (auto blank = trailing_blank_size(text)) {
            text.resize(text.size() - blank);
        }
        tags.push_back(TAG_TRAILING_WHITESPACE);
    }

    // 5. Over-length lines are only reported
    if (visible_length(text, config.tab_size) > config.line_length) {
        tags.push_back(TAG_LINE_TOO_LONG);
    }

    text += ending_text(ending);

    if (text == line) {
        return FixedLine{.text = line, .tags = std::move(tags)};
    }
    return FixedLine{.text = std::move(text), .tags = std::move(tags)};
}

auto fix_line(const Config& config, const std::string& filename, size_t line_number,
              std::string_view line, IReporter& reporter) -> FixedLine {
    auto fixed = fix_line(config, line);

    if (!fixed.tags.empty()) {
        Diagnostic diagnostic{.file_path = filename, .line_number = line_number, .tags = {}};
        diagnostic.tags.reserve(fixed.tags.size());
        for (auto tag : fixed.tags) {
            diagnostic.tags.emplace_back(tag);
        }
        reporter.report_diagnostic(diagnostic);
    }

    return fixed;
}

} // namespace wslint::core
