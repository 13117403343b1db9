#pragma once

#include <junitgrader/common/class_traits.hpp>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include <chrono>
#include <string_view>

// Compile-time level; must precede the spdlog includes
#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Wrappers for spdlog macros
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

#ifdef DEBUG
/// Evaluates `expr` and logs how long it took, at debug level
#define DEBUG_TIME(expr)                                                                                               \
    [&]() {                                                                                                            \
        const ::junitgrader::detail::ScopedTimer scoped_timer__{#expr};                                                \
        return expr;                                                                                                   \
    }()
#else
#define DEBUG_TIME(expr) expr
#endif

namespace junitgrader {
namespace detail {

/// Logs the wall time between construction and destruction
class ScopedTimer : NonMovable
{
public:
    explicit ScopedTimer(std::string_view label)
        : label_{label}
        , start_{std::chrono::steady_clock::now()} {}

    ~ScopedTimer() {
        const auto elapsed = std::chrono::steady_clock::now() - start_;
        LOG_DEBUG("{} took {}", label_, std::chrono::duration_cast<std::chrono::milliseconds>(elapsed));
    }

private:
    std::string_view label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail

inline void init_loggers() {
    // stderr only; stdout carries the grading report
    spdlog::set_default_logger(spdlog::stderr_color_st("junitgrader"));

#if defined(DEBUG)
    spdlog::set_level(spdlog::level::debug);
#elif defined(RELEASE)
    spdlog::set_level(spdlog::level::err);
#else
    spdlog::set_level(spdlog::level::warn);
#endif

    // e.g. LOG_LEVEL=trace
    spdlog::cfg::load_env_levels("LOG_LEVEL");

#if defined(DEBUG) || defined(TRACE)
    spdlog::set_pattern("[%T.%e] [%^%8l%$] [pid %6P] [%30!!@%20!s:%-4#] %v");
#else
    spdlog::set_pattern("[%T.%e] [%^%=8l%$] [pid %6P] %v");
#endif
}

} // namespace junitgrader
