#pragma once

#include <cstdio>
#include <string_view>

namespace junitgrader {

/// Whether a terminal with the given `$TERM` value understands ANSI color codes
bool term_supports_color(std::string_view term) noexcept;

/// Whether the environment asks for colored output.
/// `NO_COLOR` always disables colors, `COLORTERM` always enables them. Otherwise `$TERM` decides.
bool is_color_terminal() noexcept;

/// Whether `stream` is connected to a terminal
bool in_terminal(std::FILE* stream) noexcept;

} // namespace junitgrader
