#pragma once

#include "wslint/types.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace wslint {

struct CheckResult;

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    // Throws FileError("opening", ...) when the file cannot be read
    virtual auto open_input(const std::string& path) -> std::unique_ptr<std::istream> = 0;
    // Streams new content through writer into a temp file beside path, then renames it over path
    virtual auto replace_atomically(const std::string& path,
                                    const std::function<void(std::ostream&)>& writer) -> void = 0;
};

// Implementations must be safe to call from several worker threads
class IReporter {
public:
    virtual ~IReporter() = default;
    virtual auto report_diagnostic(const Diagnostic& diagnostic) -> void = 0;
    virtual auto report_error(const std::string& verb, const std::string& subject,
                              const std::string& message) -> void = 0;
    virtual auto report_outcome(const std::string& path, FileOutcome outcome,
                                const CheckResult& totals) -> void = 0;
    virtual auto report_summary(const RunSummary& summary) -> void = 0;
};

} // namespace wslint
