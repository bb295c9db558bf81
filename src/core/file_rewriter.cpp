#include "wslint/core/file_rewriter.hpp"
#include "wslint/core/line_fixer.hpp"
#include "wslint/io/line_reader.hpp"

namespace wslint::core {

auto rewrite_file(const Config& config, const std::string& filename, std::istream& input,
                  std::ostream& output, IReporter& reporter) -> size_t {
    LineReader reader(input);
    std::string line;
    size_t changed_lines = 0;

    while (reader.next(line)) {
        auto fixed = fix_line(config, filename, reader.line_number(), line, reporter);
        if (fixed.modified()) {
            changed_lines++;
        }

        auto text = fixed.view();
        output.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!output) {
            throw std::ios_base::failure("write failed");
        }
    }

    return changed_lines;
}

} // namespace wslint::core
