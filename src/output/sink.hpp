#pragma once

#include <string_view>

namespace junitgrader {

/// Destination of serialized grading output
class Sink
{
public:
    virtual ~Sink() = default;

    virtual void write(std::string_view str) = 0;

    /// Make everything written so far visible to the reader
    virtual void flush() = 0;
};

} // namespace junitgrader
