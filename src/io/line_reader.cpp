#include "wslint/io/line_reader.hpp"

namespace wslint {

auto LineReader::next(std::string& line) -> bool {
    using traits = std::istream::traits_type;
    line.clear();

    while (true) {
        auto ch = input_.get();
        if (traits::eq_int_type(ch, traits::eof())) {
            break;
        }

        line.push_back(traits::to_char_type(ch));
        if (ch == '\n') {
            break;
        }
        if (ch == '\r') {
            // \r\n is one terminator, a lone \r is another
            if (input_.peek() == '\n') {
                line.push_back(static_cast<char>(input_.get()));
            }
            break;
        }
    }

    if (input_.bad()) {
        throw std::ios_base::failure("read failed");
    }
    if (line.empty()) {
        return false;
    }

    line_number_++;
    return true;
}

} // namespace wslint
