#pragma once

#include "wslint/core/check_result.hpp"
#include "wslint/core/config.hpp"
#include "wslint/interfaces.hpp"
#include "wslint/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace wslint {

struct Options {
    Config base;                     // Before any modeline override
    std::vector<std::string> files;
    bool dry_run = false;            // Report only, never modify files
    size_t jobs = 1;                 // Worker threads
    bool verbose = false;
    bool show_help = false;
};

struct FileReport {
    std::string path;
    FileOutcome outcome = FileOutcome::CLEAN;
    CheckResult totals;
};

class WsLintApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IReporter> reporter_;

public:
    WsLintApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IReporter> reporter);

    // Process every file in options.files and return the exit code
    auto run(const Options& options) -> int;

    // Modeline scan -> config resolve -> full scan -> conditional rewrite.
    // Never throws; failures are reported and yield FileOutcome::FAILED.
    auto process_file(const std::string& path, const Config& base, bool dry_run) -> FileReport;

    static auto summarize(const std::vector<FileReport>& reports) -> RunSummary;
    static auto exit_status(const std::vector<FileReport>& reports) -> int;

private:
    auto process_all(const std::vector<std::string>& files, const Config& base, bool dry_run,
                     size_t jobs) -> std::vector<FileReport>;
    auto process_stages(const std::string& path, const Config& base, bool dry_run,
                        FileReport& report) -> void;
};

} // namespace wslint
