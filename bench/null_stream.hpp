#pragma once
#include <ostream>
#include <streambuf>

namespace printlog {

/// Stream that accepts and discards everything; stands in for a terminal.
class NullStream : public std::ostream {
public:
    NullStream() : std::ostream(&m_buf) {}

private:
    class NullBuf : public std::streambuf {
    protected:
        int_type overflow(int_type ch) override { return traits_type::not_eof(ch); }
        std::streamsize xsputn(const char*, std::streamsize n) override { return n; }
    };

    NullBuf m_buf;
};

} // namespace printlog
