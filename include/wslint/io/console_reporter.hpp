#pragma once

#include "wslint/interfaces.hpp"
#include <mutex>
#include <ostream>

namespace wslint {

// Diagnostics and errors go to out, the verbose log to log. Every line is
// written under one lock so concurrent workers never interleave within a line.
class ConsoleReporter : public IReporter {
public:
    ConsoleReporter(std::ostream& out, std::ostream& log, bool verbose);

    auto report_diagnostic(const Diagnostic& diagnostic) -> void override;
    auto report_error(const std::string& verb, const std::string& subject,
                      const std::string& message) -> void override;
    auto report_outcome(const std::string& path, FileOutcome outcome,
                        const CheckResult& totals) -> void override;
    auto report_summary(const RunSummary& summary) -> void override;

private:
    std::ostream& out_;
    std::ostream& log_;
    bool verbose_;
    std::mutex mutex_;
};

} // namespace wslint
