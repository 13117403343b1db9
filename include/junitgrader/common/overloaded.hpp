#pragma once

namespace junitgrader {

/// Combines several lambdas into one visitor for std::visit
template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

} // namespace junitgrader
