#include "wslint/types.hpp"
#include <sstream>

namespace wslint {

auto format_diagnostic(const Diagnostic& diagnostic) -> std::string {
    std::ostringstream oss;
    oss << diagnostic.file_path << ":" << diagnostic.line_number << ": ";
    for (size_t i = 0; i < diagnostic.tags.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << diagnostic.tags[i];
    }
    return oss.str();
}

auto outcome_name(FileOutcome outcome) -> std::string {
    switch (outcome) {
    case FileOutcome::CLEAN:
        return "clean";
    case FileOutcome::FIXED:
        return "fixed";
    case FileOutcome::WOULD_FIX:
        return "would fix";
    case FileOutcome::UNFIXABLE:
        return "unfixable";
    case FileOutcome::FAILED:
        return "failed";
    }
    return "unknown";
}

} // namespace wslint
