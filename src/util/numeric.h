#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <limits>

namespace cpamm
{
enum Rounding
{
    ROUND_DOWN,
    ROUND_UP
};

// no throw versions, return true if result is valid (fits in 64 bits)
bool checkedAdd(uint64_t& result, uint64_t a, uint64_t b);
bool checkedSubtract(uint64_t& result, uint64_t a, uint64_t b);
bool checkedMultiply(uint64_t& result, uint64_t a, uint64_t b);

// calculates A*B/C when A*B overflows 64bits. C must be non-zero, a zero C
// throws std::runtime_error while an oversized result returns false.
bool bigDivideUnsigned(uint64_t& result, uint64_t A, uint64_t B, uint64_t C,
                       Rounding rounding);

// throws std::overflow_error if the result does not fit
uint64_t bigDivideUnsignedOrThrow(uint64_t A, uint64_t B, uint64_t C,
                                  Rounding rounding);

// This only implements ROUND_DOWN
uint64_t bigSquareRoot(uint64_t a, uint64_t b);

// floor(sqrt(a))
uint64_t integerSquareRoot(uint64_t a);
}
