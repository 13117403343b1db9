#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace junitgrader {

/// Grades every student repo given on the command line
class GradeApp final : public App
{
public:
    using App::App;

    /// Exit statuses above this are reserved by shells
    static constexpr int MAX_EXIT_CODE = 125;

private:
    int run_impl() override;
};

} // namespace junitgrader
