#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace junitgrader {

/// Creates the reference tests directory from checked out template repos
class GenerateRtdApp final : public App
{
public:
    using App::App;

    static constexpr auto COMMAND_NAME = "generate-rtd";

private:
    int run_impl() override;
};

} // namespace junitgrader
