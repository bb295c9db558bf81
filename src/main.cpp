#include "wslint/application/cli.hpp"
#include "wslint/application/wslint_app.hpp"
#include "wslint/io/console_reporter.hpp"
#include "wslint/io/file_system.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    wslint::Options options;
    try {
        options = wslint::parse_args(args, wslint::process_environment());
    } catch (const wslint::UsageError& e) {
        std::cerr << "wslint: " << e.what() << "\n";
        std::cerr << "Try 'wslint --help' for more information.\n";
        return wslint::exit_code::USAGE;
    }

    if (options.show_help) {
        std::cout << wslint::usage_text();
        return 0;
    }

    wslint::WsLintApp app(std::make_unique<wslint::FileSystem>(),
                          std::make_unique<wslint::ConsoleReporter>(std::cout, std::cerr,
                                                                    options.verbose));
    return app.run(options);
}
