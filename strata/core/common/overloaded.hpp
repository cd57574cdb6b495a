// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace strata {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace strata
