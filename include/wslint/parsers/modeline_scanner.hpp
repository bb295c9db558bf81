#pragma once

#include <istream>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace wslint {

// Finds editor modelines such as "// vim: et ts=2" anywhere in a file
class ModelineScanner {
public:
    // Settings text of the last modeline in input, if any
    auto scan(std::istream& input) -> std::optional<std::string>;

    // Settings text of a modeline on a single line (terminator allowed)
    auto match_line(std::string_view line) -> std::optional<std::string>;

private:
    // Marker only; the settings are the rest of the line. Matching them with
    // std::regex overflows the stack on very long lines.
    static inline const std::regex marker_pattern_{R"( (vim|vi|ex): )"};
};

} // namespace wslint
