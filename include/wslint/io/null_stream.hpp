#pragma once

#include <ostream>
#include <streambuf>

namespace wslint {

// Accepts and drops everything, without ever failing
class NullBuffer : public std::streambuf {
protected:
    auto overflow(int_type ch) -> int_type override { return traits_type::not_eof(ch); }
    auto xsputn(const char_type* /*s*/, std::streamsize count) -> std::streamsize override
    {
        return count;
    }
};

class NullStream : public std::ostream {
public:
    NullStream() : std::ostream(&buffer_) {}

private:
    NullBuffer buffer_;
};

} // namespace wslint
