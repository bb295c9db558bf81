#include "wslint/core/file_scanner.hpp"
#include "wslint/core/line_classifier.hpp"
#include "wslint/io/line_reader.hpp"

namespace wslint::core {

auto scan_file(const Config& config, std::istream& input) -> CheckResult {
    CheckResult totals;
    LineReader reader(input);
    std::string line;

    while (reader.next(line)) {
        totals += classify_line(config, line);
    }

    return totals;
}

} // namespace wslint::core
