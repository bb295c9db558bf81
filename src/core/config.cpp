#include "wslint/core/config.hpp"
#include <charconv>

namespace wslint {

auto resolve_config(const Config& base, std::string_view modeline) -> Config {
    Config config = base;

    // Split on single spaces; consecutive spaces yield empty tokens, which match nothing
    size_t start = 0;
    while (start <= modeline.size()) {
        auto end = modeline.find(' ', start);
        if (end == std::string_view::npos) {
            end = modeline.size();
        }
        auto token = modeline.substr(start, end - start);

        if (token == "et") {
            config.expand_tabs = true;
        } else if (token == "noet") {
            config.expand_tabs = false;
        } else if (token.starts_with("ts=")) {
            auto value = token.substr(3);
            if (value.starts_with('+')) {
                value.remove_prefix(1);
            }
            if (auto tab_size = parse_positive(value)) {
                config.tab_size = *tab_size;
            }
        }

        start = end + 1;
    }

    return config;
}

auto parse_positive(std::string_view text) -> std::optional<size_t> {
    if (text.empty()) {
        return std::nullopt;
    }

    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace wslint
