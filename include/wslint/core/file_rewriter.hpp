#pragma once

#include "wslint/core/check_result.hpp"
#include "wslint/core/config.hpp"
#include "wslint/interfaces.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace wslint::core {

// Fix every line of input into output, reporting one diagnostic per violating
// line. This is the only reporting pass; pass a NullStream as output to get
// diagnostics without keeping the corrected text.
// Returns the number of lines whose text changed.
// Throws std::ios_base::failure on a read or write error.
auto rewrite_file(const Config& config, const std::string& filename, std::istream& input,
                  std::ostream& output, IReporter& reporter) -> size_t;

} // namespace wslint::core
