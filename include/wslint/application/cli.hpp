#pragma once

#include "wslint/application/wslint_app.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wslint {

// Bad flags, bad values or no files. main() prints it and exits with exit_code::USAGE.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment
auto process_environment() -> EnvLookup;

// Build run options from arguments (argv without the program name) and the
// WSLINT_* environment variables. Flags override the environment.
auto parse_args(const std::vector<std::string>& args, const EnvLookup& env) -> Options;

auto usage_text() -> std::string;

} // namespace wslint
