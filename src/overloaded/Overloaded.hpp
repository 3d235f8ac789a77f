// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

namespace linkwatch
{
// visitor built from lambdas, for std::visit over addresses and tunnel commands
template<typename... T>
struct Overloaded : T...
{
    using T::operator()...;
};

template<class... T>
Overloaded(T...) -> Overloaded<T...>;
}  // namespace linkwatch
