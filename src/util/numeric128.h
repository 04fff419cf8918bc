#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/numeric.h"
#include <uint128_t.h>

namespace cpamm
{
using uint128_t = large_int::uint128_t;

inline uint128_t
uint128_max()
{
    return ~uint128_t(0ull);
}

// number of significant bits in x
inline int
uint128_bits(uint128_t const& x)
{
    if (x == 0ul)
    {
        return 0;
    }
    else
    {
        return 128 - large_int::clz_helper<uint128_t>::clz(x);
    }
}

bool bigDivideUnsigned128(uint64_t& result, uint128_t const& a, uint64_t B,
                          Rounding rounding);
uint64_t bigDivideUnsignedOrThrow128(uint128_t const& a, uint64_t B,
                                     Rounding rounding);

uint128_t bigMultiplyUnsigned(uint64_t a, uint64_t b);
}
