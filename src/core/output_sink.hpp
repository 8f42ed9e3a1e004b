#pragma once

#include <string>
#include <fmt/format.h>

// Where diagnostic text goes. The convenience layer writes to stderr;
// environments without one inject their own sink.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Raw text, written as-is.
    virtual void write_str(const std::string& s) = 0;

    // Formatted text. Defaults to formatting into a string and calling write_str.
    virtual void write_formatted(fmt::string_view format, fmt::format_args args);

    template <typename... Args>
    void print(fmt::format_string<Args...> format, Args&&... args) {
        write_formatted(fmt::string_view(format), fmt::make_format_args(args...));
    }
};

// Discards everything
class NullSink : public OutputSink {
public:
    void write_str(const std::string&) override {}
    void write_formatted(fmt::string_view, fmt::format_args) override {}
};

// Accumulates into a string (tests, or hosts that forward text themselves)
class StringSink : public OutputSink {
public:
    void write_str(const std::string& s) override { buffer_ += s; }

    const std::string& str() const { return buffer_; }
    void clear() { buffer_.clear(); }

private:
    std::string buffer_;
};
