#include "output/file_sink.hpp"

#include <junitgrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cstdio>
#include <string_view>

namespace junitgrader {

FileSink::FileSink(std::FILE* stream)
    : stream_{stream} {
    ASSERT(stream_ != nullptr);
}

void FileSink::write(std::string_view str) {
    fmt::print(stream_, "{}", str);
}

void FileSink::flush() {
    if (std::fflush(stream_) != 0) {
        LOG_WARN("Failed to flush output stream");
    }
}

} // namespace junitgrader
