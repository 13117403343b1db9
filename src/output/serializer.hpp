#pragma once

#include "output/sink.hpp"

#include <junitgrader/common/class_traits.hpp>
#include <junitgrader/grading_session.hpp>

#include <string_view>

namespace junitgrader {

class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink)
        : sink_{sink} {}

    virtual ~Serializer() = default;

    virtual void on_repo_result(const RepoResult& data) = 0;
    virtual void on_multi_repo_result(const MultiRepoResult& data) = 0;

    /// Result of a command that does not grade repos, such as generating the reference tests directory
    virtual void on_command_result(std::string_view command, Severity status, std::string_view msg) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
};

} // namespace junitgrader
