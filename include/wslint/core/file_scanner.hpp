#pragma once

#include "wslint/core/check_result.hpp"
#include "wslint/core/config.hpp"
#include <istream>

namespace wslint::core {

// Classify every line from the current position to end of input and sum the results.
// Throws std::ios_base::failure on a read error.
auto scan_file(const Config& config, std::istream& input) -> CheckResult;

} // namespace wslint::core
