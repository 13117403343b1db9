#pragma once

#include "app/trace_exception.hpp"
#include "output/file_sink.hpp"
#include "output/plaintext_serializer.hpp"
#include "user/program_options.hpp"

#include <junitgrader/common/class_traits.hpp>

#include <cstdio>
#include <memory>
#include <optional>
#include <utility>

namespace junitgrader {

/// A command of the junitgrader executable
///
/// Owns the parsed options and the stdout report stream. Subclasses implement `run_impl` and
/// return the process exit status.
class App : NonMovable
{
public:
    explicit App(ProgramOptions options)
        : options_{std::move(options)}
        , stdout_sink_{stdout}
        , serializer_{std::make_shared<PlainTextSerializer>(stdout_sink_, options_.grader.colorize)} {}

    virtual ~App() = default;

    const ProgramOptions& get_options() const { return options_; }

    /// Runs the command. An escaping exception is traced to stderr and
    /// reported as EXIT_INTERNAL_ERROR.
    int run() noexcept {
        std::optional status = wrap_throwable_fn(&App::run_impl, this);

        return status.value_or(EXIT_INTERNAL_ERROR);
    }

    static constexpr int EXIT_INTERNAL_ERROR = 126;

protected:
    virtual int run_impl() = 0;

    const std::shared_ptr<PlainTextSerializer>& get_serializer() const { return serializer_; }

private:
    ProgramOptions options_;
    FileSink stdout_sink_;
    std::shared_ptr<PlainTextSerializer> serializer_;
};

} // namespace junitgrader
