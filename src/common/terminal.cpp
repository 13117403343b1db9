#include "common/terminal.hpp"

#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <string_view>

#include <unistd.h>

namespace junitgrader {

namespace {

bool env_is_set(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && *value != '\0';
}

} // namespace

// Terminal families from spdlog's color detection
bool term_supports_color(std::string_view term) noexcept {
    static constexpr std::array<std::string_view, 16> COLOR_TERMS = {
        "ansi", "color", "console", "cygwin", "gnome", "konsole", "kterm", "linux",
        "msys", "putty", "rxvt",  "screen",  "vt100",  "xterm", "alacritty", "vt102"};

    if (term.empty() || term == "dumb") {
        return false;
    }

    return ranges::any_of(COLOR_TERMS, [term](std::string_view color_term) { return term.contains(color_term); });
}

bool is_color_terminal() noexcept {
    // https://no-color.org
    if (env_is_set("NO_COLOR")) {
        return false;
    }

    if (env_is_set("COLORTERM")) {
        return true;
    }

    const char* term = std::getenv("TERM");

    return term != nullptr && term_supports_color(term);
}

bool in_terminal(std::FILE* stream) noexcept {
    return ::isatty(::fileno(stream)) != 0;
}

} // namespace junitgrader
