#pragma once

#include <istream>
#include <string>

namespace wslint {

// Splits a byte stream into lines ending in \n, \r or \r\n. The terminator is
// kept; the last line may have none.
class LineReader {
public:
    explicit LineReader(std::istream& input) : input_(input) {}

    // Replace line with the next line. Returns false at end of input.
    // Throws std::ios_base::failure if the stream goes bad.
    auto next(std::string& line) -> bool;

    // 1-based number of the line last returned by next()
    auto line_number() const -> size_t { return line_number_; }

private:
    std::istream& input_;
    size_t line_number_ = 0;
};

} // namespace wslint
