#include "wslint/application/cli.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace wslint {

namespace {

auto parse_count(const std::string& what, const std::string& text) -> size_t {
    if (auto value = parse_positive(text)) {
        return *value;
    }
    throw UsageError("invalid " + what + " '" + text + "' (expected a positive integer)");
}

auto parse_flag(const std::string& name, std::string text) -> bool {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off" || text.empty()) {
        return false;
    }
    throw UsageError("invalid value '" + text + "' for " + name);
}

auto apply_environment(Options& options, const EnvLookup& env) -> void {
    if (!env) {
        return;
    }
    if (auto value = env("WSLINT_EXPAND_TABS")) {
        options.base.expand_tabs = parse_flag("WSLINT_EXPAND_TABS", *value);
    }
    if (auto value = env("WSLINT_TAB_SIZE")) {
        options.base.tab_size = parse_count("WSLINT_TAB_SIZE", *value);
    }
    if (auto value = env("WSLINT_LINE_LENGTH")) {
        options.base.line_length = parse_count("WSLINT_LINE_LENGTH", *value);
    }
    if (auto value = env("WSLINT_JOBS")) {
        options.jobs = parse_count("WSLINT_JOBS", *value);
    }
}

} // namespace

auto process_environment() -> EnvLookup {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

auto parse_args(const std::vector<std::string>& args, const EnvLookup& env) -> Options {
    Options options;
    apply_environment(options, env);

    bool options_done = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto take_value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw UsageError("option '" + arg + "' requires an argument");
            }
            return args[++i];
        };

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            options.files.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "-e" || arg == "--expand-tabs") {
            options.base.expand_tabs = true;
        } else if (arg == "--no-expand-tabs") {
            options.base.expand_tabs = false;
        } else if (arg == "-t" || arg == "--tab-size") {
            options.base.tab_size = parse_count("tab size", take_value());
        } else if (arg == "-l" || arg == "--line-length") {
            options.base.line_length = parse_count("line length", take_value());
        } else if (arg == "-j" || arg == "--jobs") {
            options.jobs = parse_count("job count", take_value());
        } else if (arg == "-n" || arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else {
            throw UsageError("unknown option '" + arg + "'");
        }
    }

    if (options.files.empty() && !options.show_help) {
        throw UsageError("no input files");
    }

    return options;
}

auto usage_text() -> std::string {
    return "Usage: wslint [options] <file>...\n"
           "Check and fix tabs, line endings, trailing whitespace and line length.\n"
           "\n"
           "  -e, --expand-tabs        Replace tabs with spaces    (WSLINT_EXPAND_TABS)\n"
           "      --no-expand-tabs     Keep tab indentation (default)\n"
           "  -t, --tab-size <N>       Columns per tab, default 4  (WSLINT_TAB_SIZE)\n"
           "  -l, --line-length <N>    Maximum line width, default 80 (WSLINT_LINE_LENGTH)\n"
           "  -n, --dry-run            Report problems without modifying files\n"
           "  -j, --jobs <N>           Process N files in parallel (WSLINT_JOBS)\n"
           "  -v, --verbose            Log each file's outcome and a summary to stderr\n"
           "  -h, --help               Show this help\n"
           "\n"
           "A modeline such as '// vim: et ts=2' inside a file overrides\n"
           "expand-tabs and tab-size for that file.\n"
           "\n"
           "Exit status: 0 clean, 1 fixed, 2 unfixable problems remain,\n"
           "             3 a file could not be processed, 64 usage error.\n";
}

} // namespace wslint
