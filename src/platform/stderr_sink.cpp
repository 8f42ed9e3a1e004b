#include "stderr_sink.hpp"

void StderrSink::write_str(const std::string& s) {
    std::fwrite(s.data(), 1, s.size(), stream_);
    std::fflush(stream_);
}

void StderrSink::write_formatted(fmt::string_view format, fmt::format_args args) {
    fmt::vprint(stream_, format, args);
    std::fflush(stream_);
}
