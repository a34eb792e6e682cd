// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "double_double.h"

namespace errol {
namespace impl {

constexpr int MinPowerOf10 = -291;
constexpr int MaxPowerOf10 =  308;
constexpr int NumPowersOf10 = MaxPowerOf10 - MinPowerOf10 + 1;

// Returns 10^k in double-double precision.
// PRE: MinPowerOf10 <= k <= MaxPowerOf10
DoubleDouble PowerOf10(int k);

} // namespace impl
} // namespace errol
