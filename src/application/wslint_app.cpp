#include "wslint/application/wslint_app.hpp"
#include "wslint/core/file_rewriter.hpp"
#include "wslint/core/file_scanner.hpp"
#include "wslint/io/file_error.hpp"
#include "wslint/io/null_stream.hpp"
#include "wslint/parsers/modeline_scanner.hpp"
#include <algorithm>
#include <atomic>
#include <istream>
#include <thread>

namespace wslint {

namespace {

// Run one stage, tagging anything it throws with the stage's verb
template<typename Stage>
auto run_stage(const std::string& verb, const std::string& path, Stage&& stage) {
    try {
        return stage();
    } catch (const FileError&) {
        throw;
    } catch (const std::exception& e) {
        throw FileError(verb, path, e.what());
    }
}

auto rewind(std::istream& input, const std::string& path) -> void {
    input.clear();
    input.seekg(0, std::ios::beg);
    if (!input) {
        throw FileError("reading", path, "cannot seek to start of file");
    }
}

} // namespace

WsLintApp::WsLintApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IReporter> reporter)
    : filesystem_(std::move(filesystem)), reporter_(std::move(reporter)) {}

auto WsLintApp::run(const Options& options) -> int {
    auto reports = process_all(options.files, options.base, options.dry_run, options.jobs);
    reporter_->report_summary(summarize(reports));
    return exit_status(reports);
}

auto WsLintApp::process_all(const std::vector<std::string>& files, const Config& base,
                            bool dry_run, size_t jobs) -> std::vector<FileReport> {
    std::vector<FileReport> reports(files.size());
    size_t worker_count = std::min(std::max<size_t>(jobs, 1), files.size());

    if (worker_count <= 1) {
        for (size_t i = 0; i < files.size(); ++i) {
            reports[i] = process_file(files[i], base, dry_run);
        }
        return reports;
    }

    // Workers share only the read-only base config, the reporter and the work index.
    // Each slot of reports is written by exactly one worker.
    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        for (size_t i = next_index++; i < files.size(); i = next_index++) {
            reports[i] = process_file(files[i], base, dry_run);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    return reports;
}

auto WsLintApp::process_file(const std::string& path, const Config& base, bool dry_run)
    -> FileReport {
    FileReport report{.path = path, .outcome = FileOutcome::CLEAN, .totals = {}};

    try {
        process_stages(path, base, dry_run, report);
    } catch (const FileError& e) {
        reporter_->report_error(e.verb(), e.subject(), e.what());
        report.outcome = FileOutcome::FAILED;
    } catch (const std::exception& e) {
        reporter_->report_error("processing", path, e.what());
        report.outcome = FileOutcome::FAILED;
    }

    reporter_->report_outcome(report.path, report.outcome, report.totals);
    return report;
}

auto WsLintApp::process_stages(const std::string& path, const Config& base, bool dry_run,
                               FileReport& report) -> void {
    auto input = filesystem_->open_input(path);

    // First pass: modeline
    auto modeline = run_stage("reading", path, [&] { return ModelineScanner{}.scan(*input); });
    const Config config = modeline ? resolve_config(base, *modeline) : base;

    // Second pass: count violations
    rewind(*input, path);
    report.totals = run_stage("reading", path, [&] { return core::scan_file(config, *input); });
    if (report.totals.clean()) {
        report.outcome = FileOutcome::CLEAN;
        return;
    }

    // Third pass: fix and report
    rewind(*input, path);
    if (report.totals.fixable > 0 && !dry_run) {
        filesystem_->replace_atomically(path, [&](std::ostream& output) {
            run_stage("fixing", path, [&] {
                return core::rewrite_file(config, path, *input, output, *reporter_);
            });
        });
        report.outcome = FileOutcome::FIXED;
        return;
    }

    NullStream discard;
    run_stage("fixing", path,
              [&] { return core::rewrite_file(config, path, *input, discard, *reporter_); });
    report.outcome = report.totals.fixable > 0 ? FileOutcome::WOULD_FIX : FileOutcome::UNFIXABLE;
}

auto WsLintApp::summarize(const std::vector<FileReport>& reports) -> RunSummary {
    RunSummary summary;
    for (const auto& report : reports) {
        switch (report.outcome) {
        case FileOutcome::CLEAN:
            summary.clean++;
            break;
        case FileOutcome::FIXED:
        case FileOutcome::WOULD_FIX:
            summary.fixed++;
            break;
        case FileOutcome::UNFIXABLE:
            summary.unfixable++;
            break;
        case FileOutcome::FAILED:
            summary.failed++;
            break;
        }
    }
    return summary;
}

auto WsLintApp::exit_status(const std::vector<FileReport>& reports) -> int {
    int status = exit_code::CLEAN;
    for (const auto& report : reports) {
        int file_status = exit_code::CLEAN;
        if (report.outcome == FileOutcome::FAILED) {
            file_status = exit_code::FAILED;
        } else if (report.totals.unfixable > 0) {
            file_status = exit_code::UNFIXABLE;
        } else if (report.totals.fixable > 0) {
            file_status = exit_code::FIXED;
        }
        status = std::max(status, file_status);
    }
    return status;
}

} // namespace wslint
