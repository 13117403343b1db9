#pragma once

#include "output/sink.hpp"

#include <cstdio>
#include <string_view>

namespace junitgrader {

/// Writes to a C stream, such as stdout. The stream is not owned, and stays open.
class FileSink : public Sink
{
public:
    explicit FileSink(std::FILE* stream);

    void write(std::string_view str) override;
    void flush() override;

    std::FILE* get_stream() const { return stream_; }

private:
    std::FILE* stream_;
};

} // namespace junitgrader
