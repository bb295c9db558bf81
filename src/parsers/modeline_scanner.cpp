#include "wslint/parsers/modeline_scanner.hpp"
#include "wslint/core/line.hpp"
#include "wslint/io/line_reader.hpp"

namespace wslint {

auto ModelineScanner::scan(std::istream& input) -> std::optional<std::string> {
    LineReader reader(input);
    std::string line;
    std::optional<std::string> modeline;

    // Every line is checked; a later modeline replaces an earlier one
    while (reader.next(line)) {
        if (auto settings = match_line(line)) {
            modeline = std::move(settings);
        }
    }

    return modeline;
}

auto ModelineScanner::match_line(std::string_view line) -> std::optional<std::string> {
    auto content = split_line(line).content;

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(content.begin(), content.end(), match, marker_pattern_)) {
        return std::nullopt;
    }

    auto settings = content.substr(static_cast<size_t>(match.position(0) + match.length(0)));
    if (settings.empty()) {
        return std::nullopt;
    }
    return std::string(settings);
}

} // namespace wslint
