#pragma once

namespace util {

/// Builds a visitor for std::visit out of lambdas.
template<typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace util
