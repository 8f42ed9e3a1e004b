#include "output_sink.hpp"

void OutputSink::write_formatted(fmt::string_view format, fmt::format_args args) {
    write_str(fmt::vformat(format, args));
}
