#pragma once

#include <string>
#include <cstdio>
#include <core/output_sink.hpp>

// Default diagnostic sink: unbuffered writes to a stdio stream (stderr unless
// told otherwise).
class StderrSink : public OutputSink {
public:
    explicit StderrSink(FILE* stream = stderr) : stream_(stream) {}

    void write_str(const std::string& s) override;
    void write_formatted(fmt::string_view format, fmt::format_args args) override;

private:
    FILE* stream_;
};
