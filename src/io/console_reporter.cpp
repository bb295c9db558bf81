#include "wslint/io/console_reporter.hpp"
#include "wslint/core/check_result.hpp"

namespace wslint {

ConsoleReporter::ConsoleReporter(std::ostream& out, std::ostream& log, bool verbose)
    : out_(out), log_(log), verbose_(verbose) {}

auto ConsoleReporter::report_diagnostic(const Diagnostic& diagnostic) -> void {
    auto text = format_diagnostic(diagnostic);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << "\n";
}

auto ConsoleReporter::report_error(const std::string& verb, const std::string& subject,
                                   const std::string& message) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "Error " << verb << " " << subject << ": " << message << "\n";
}

auto ConsoleReporter::report_outcome(const std::string& path, FileOutcome outcome,
                                     const CheckResult& totals) -> void {
    if (!verbose_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    log_ << path << ": " << outcome_name(outcome) << " (" << totals.fixable << " fixable, "
         << totals.unfixable << " unfixable)\n";
}

auto ConsoleReporter::report_summary(const RunSummary& summary) -> void {
    if (!verbose_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    log_ << "Processed " << summary.total() << " files: " << summary.clean << " clean, "
         << summary.fixed << " fixed, " << summary.unfixable << " unfixable, " << summary.failed
         << " failed\n";
}

} // namespace wslint
