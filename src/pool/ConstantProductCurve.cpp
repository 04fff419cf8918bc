// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/ConstantProductCurve.h"
#include "pool/PoolGuard.h"
#include "util/GlobalChecks.h"
#include "util/numeric.h"
#include "util/numeric128.h"

#include <stdexcept>

namespace cpamm
{

bool
getPoolDepositAmounts(uint64_t& amountX, uint64_t& amountY, uint64_t reserveX,
                      uint64_t reserveY, uint64_t totalPoolShares,
                      uint64_t shareAmount)
{
    releaseAssertOrThrow(totalPoolShares != 0);

    uint64_t x = 0;
    uint64_t y = 0;
    if (!bigDivideUnsigned(x, reserveX, shareAmount, totalPoolShares,
                           ROUND_UP) ||
        !bigDivideUnsigned(y, reserveY, shareAmount, totalPoolShares,
                           ROUND_UP))
    {
        return false;
    }
    amountX = x;
    amountY = y;
    return true;
}

uint64_t
getPoolWithdrawalAmount(uint64_t amountPoolShares, uint64_t totalPoolShares,
                        uint64_t reserve)
{
    if (amountPoolShares > totalPoolShares)
    {
        throw std::runtime_error("Invalid amountPoolShares");
    }
    return bigDivideUnsignedOrThrow(amountPoolShares, reserve,
                                    totalPoolShares, ROUND_DOWN);
}

uint64_t
getAmountAfterFee(uint64_t amount, uint32_t feeBps)
{
    releaseAssertOrThrow(feeBps <= FEE_BPS_DENOMINATOR);
    // cannot overflow, the result is at most amount
    return bigDivideUnsignedOrThrow(amount, FEE_BPS_DENOMINATOR - feeBps,
                                    FEE_BPS_DENOMINATOR, ROUND_DOWN);
}

PoolResultCode
exchangeWithPool(uint64_t reserveIn, uint64_t reserveOut, uint64_t amountIn,
                 uint32_t feeBps, uint64_t& amountOut)
{
    if (reserveIn == 0 || reserveOut == 0)
    {
        return POOL_UNDEFINED_PRICE;
    }

    // the whole input ends up in the pool, fee included
    uint64_t newReserveIn = 0;
    if (!checkedAdd(newReserveIn, reserveIn, amountIn))
    {
        return POOL_ARITHMETIC_OVERFLOW;
    }

    uint64_t effective = getAmountAfterFee(amountIn, feeBps);
    if (effective == 0)
    {
        return POOL_INVALID_AMOUNT;
    }

    // reserveIn + effective <= reserveIn + amountIn, checked above
    uint64_t out = 0;
    if (!bigDivideUnsigned(out, reserveOut, effective, reserveIn + effective,
                           ROUND_DOWN))
    {
        // the quotient is below reserveOut
        throw std::runtime_error("swap output overflowed");
    }

    if (out >= reserveOut)
    {
        return POOL_INSUFFICIENT_LIQUIDITY;
    }

    amountOut = out;
    return POOL_SUCCESS;
}

uint64_t
getBootstrapShareAmount(uint64_t amountX, uint64_t amountY)
{
    return bigSquareRoot(amountX, amountY);
}

PoolResultCode
getSpotPrice(PoolSnapshot const& snapshot, PoolAsset side, uint64_t& price)
{
    PoolGuard::checkPoolState(snapshot);

    uint64_t reserveSide =
        side == POOL_ASSET_X ? snapshot.reserveX : snapshot.reserveY;
    uint64_t reserveOther =
        side == POOL_ASSET_X ? snapshot.reserveY : snapshot.reserveX;
    if (reserveSide == 0 || reserveOther == 0)
    {
        return POOL_UNDEFINED_PRICE;
    }

    uint64_t scale = 1;
    for (uint32_t i = 0; i < snapshot.shareDecimals; ++i)
    {
        if (!checkedMultiply(scale, scale, 10))
        {
            return POOL_ARITHMETIC_OVERFLOW;
        }
    }

    if (!bigDivideUnsigned(price, reserveOther, scale, reserveSide,
                           ROUND_DOWN))
    {
        return POOL_ARITHMETIC_OVERFLOW;
    }
    return POOL_SUCCESS;
}
}
