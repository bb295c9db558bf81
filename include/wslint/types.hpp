#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace wslint {

// Line terminator, classified exactly once per line
enum class LineEnding {
    LF,     // \n
    CR,     // \r (classic Mac)
    CRLF,   // \r\n (Windows)
    NONE    // trailing fragment at end of file
};

// What happened to one file
enum class FileOutcome {
    CLEAN,      // No violations, file untouched
    FIXED,      // Rewritten in place
    WOULD_FIX,  // Fixable violations found under --dry-run
    UNFIXABLE,  // Only unfixable violations, file untouched
    FAILED      // An error aborted this file
};

// One report line: "<file_path>:<line_number>: <tags>"
struct Diagnostic {
    std::string file_path;
    size_t line_number{};  // 1-based
    std::vector<std::string> tags;

    auto operator==(const Diagnostic& other) const -> bool = default;
};

// Per-outcome file counts for the end-of-run summary
struct RunSummary {
    size_t clean{};
    size_t fixed{};      // Includes WOULD_FIX under --dry-run
    size_t unfixable{};
    size_t failed{};

    auto total() const -> size_t { return clean + fixed + unfixable + failed; }
};

// Process exit status, highest applicable wins
namespace exit_code {
inline constexpr int CLEAN = 0;
inline constexpr int FIXED = 1;
inline constexpr int UNFIXABLE = 2;
inline constexpr int FAILED = 3;
inline constexpr int USAGE = 64;
} // namespace exit_code

auto format_diagnostic(const Diagnostic& diagnostic) -> std::string;
auto outcome_name(FileOutcome outcome) -> std::string;

} // namespace wslint
