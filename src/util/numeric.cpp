// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/numeric.h"
#include "util/GlobalChecks.h"
#include "util/numeric128.h"

#include <stdexcept>

namespace cpamm
{

bool
checkedAdd(uint64_t& result, uint64_t a, uint64_t b)
{
    if (std::numeric_limits<uint64_t>::max() - a < b)
    {
        return false;
    }
    result = a + b;
    return true;
}

bool
checkedSubtract(uint64_t& result, uint64_t a, uint64_t b)
{
    if (a < b)
    {
        return false;
    }
    result = a - b;
    return true;
}

bool
checkedMultiply(uint64_t& result, uint64_t a, uint64_t b)
{
    uint128_t x = bigMultiplyUnsigned(a, b);
    if (x > UINT64_MAX)
    {
        return false;
    }
    result = (uint64_t)x;
    return true;
}

bool
bigDivideUnsigned(uint64_t& result, uint64_t A, uint64_t B, uint64_t C,
                  Rounding rounding)
{
    releaseAssertOrThrow(C > 0);

    // A * B + C - 1 <= UINT128_MAX for any 64-bit A, B and C
    uint128_t a(A);
    uint128_t b(B);
    uint128_t c(C);
    uint128_t x = rounding == ROUND_DOWN ? (a * b) / c : (a * b + c - 1u) / c;

    if (x > UINT64_MAX)
    {
        return false;
    }
    result = (uint64_t)x;
    return true;
}

uint64_t
bigDivideUnsignedOrThrow(uint64_t A, uint64_t B, uint64_t C, Rounding rounding)
{
    uint64_t res;
    if (!bigDivideUnsigned(res, A, B, C, rounding))
    {
        throw std::overflow_error("overflow while performing bigDivide");
    }
    return res;
}

bool
bigDivideUnsigned128(uint64_t& result, uint128_t const& a, uint64_t B,
                     Rounding rounding)
{
    releaseAssertOrThrow(B != 0);

    uint128_t b(B);

    // a + b - 1 would wrap when rounding up close to UINT128_MAX; the quotient
    // would not fit in 64 bits anyway since UINT128_MAX / UINT64_MAX is
    // UINT64_MAX + 2.
    uint128_t const UINT128_MAX = uint128_max();
    if ((rounding == ROUND_UP) && (a > UINT128_MAX - (b - 1u)))
    {
        return false;
    }

    uint128_t x = rounding == ROUND_DOWN ? a / b : (a + b - 1u) / b;

    if (x > UINT64_MAX)
    {
        return false;
    }
    result = (uint64_t)x;
    return true;
}

uint64_t
bigDivideUnsignedOrThrow128(uint128_t const& a, uint64_t B, Rounding rounding)
{
    uint64_t res;
    if (!bigDivideUnsigned128(res, a, B, rounding))
    {
        throw std::overflow_error("overflow while performing bigDivide");
    }
    return res;
}

uint128_t
bigMultiplyUnsigned(uint64_t a, uint64_t b)
{
    uint128_t A(a);
    uint128_t B(b);
    return A * B;
}

// Integer Babylonian iteration
//     x[n+1] = ceil((x[n] + ceil(R / x[n])) / 2)
// decreases monotonically towards ceil(sqrt(R+1)) from any seed
// x[0] >= ceil(sqrt(R+1)), and the error at least halves (plus one) every
// step. Running it on R = a * b - 1 yields ceil(sqrt(a * b)).
static uint64_t
bigSquareRootCeil(uint64_t a, uint64_t b)
{
    // a * b = 0 is a special-case because we can't compute a * b - 1
    if (a == 0 || b == 0)
    {
        return 0;
    }
    uint128_t R = bigMultiplyUnsigned(a, b) - 1u;

    // Seed with a power of two that is at least ceil(sqrt(R+1))
    int numBits = uint128_bits(R) / 2 + 1;
    uint64_t x = numBits >= 64 ? UINT64_MAX : (1ull << numBits);

    uint64_t prev = 0;
    while (x != prev)
    {
        prev = x;

        uint64_t y = 0;
        if (!bigDivideUnsigned128(y, R, x, ROUND_UP))
        {
            throw std::runtime_error("Overflow during bigSquareRoot");
        }

        if (UINT64_MAX - x <= y)
        {
            uint128_t temp(1u);
            temp += x;
            temp += y;
            x = (uint64_t)(temp / 2u);
        }
        else // UINT64_MAX >= x + y + 1
        {
            x = (x + y + 1) / 2;
        }
    }

    return x;
}

// Find x such that x * x <= a * b < (x+1) * (x+1).
uint64_t
bigSquareRoot(uint64_t a, uint64_t b)
{
    uint64_t sqrtCeil = bigSquareRootCeil(a, b);

    // sqrtCeil * sqrtCeil >= a * b, so equality means the root is exact
    if (bigMultiplyUnsigned(sqrtCeil, sqrtCeil) <= bigMultiplyUnsigned(a, b))
    {
        return sqrtCeil;
    }

    // otherwise sqrtCeil > 0 and (sqrtCeil - 1)^2 < a * b
    return sqrtCeil - 1;
}

uint64_t
integerSquareRoot(uint64_t a)
{
    return bigSquareRoot(a, 1);
}
}
