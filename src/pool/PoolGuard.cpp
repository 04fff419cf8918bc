// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolGuard.h"
#include "util/Logging.h"

#include <stdexcept>

namespace cpamm
{

bool
PoolGuard::isValidPoolState(PoolSnapshot const& snapshot)
{
    bool emptyReserves = snapshot.reserveX == 0 && snapshot.reserveY == 0;
    bool emptySupply = snapshot.totalPoolShares == 0;
    return emptyReserves == emptySupply &&
           snapshot.feeBps <= FEE_BPS_DENOMINATOR;
}

void
PoolGuard::checkPoolState(PoolSnapshot const& snapshot)
{
    if (!isValidPoolState(snapshot))
    {
        CLOG_ERROR(Pool, "Invalid pool state: {}", toString(snapshot));
        throw std::runtime_error("invalid pool state");
    }
}

PoolResultCode
PoolGuard::checkNotLocked(PoolSnapshot const& snapshot)
{
    return snapshot.locked ? POOL_LOCKED : POOL_SUCCESS;
}

PoolResultCode
PoolGuard::checkRequest(DepositRequest const& request)
{
    return request.shareAmount == 0 ? POOL_INVALID_AMOUNT : POOL_SUCCESS;
}

PoolResultCode
PoolGuard::checkRequest(WithdrawRequest const& request)
{
    // without any floor a withdrawal paying nothing would be accepted
    if (request.shareAmount == 0 ||
        (request.minAmountX == 0 && request.minAmountY == 0))
    {
        return POOL_INVALID_AMOUNT;
    }
    return POOL_SUCCESS;
}

PoolResultCode
PoolGuard::checkRequest(SwapRequest const& request)
{
    return request.inputAmount == 0 ? POOL_INVALID_AMOUNT : POOL_SUCCESS;
}

PoolResultCode
PoolGuard::checkBounds(DepositRequest const& request,
                       CurveResult const& amounts)
{
    if (amounts.amountX > request.maxAmountX ||
        amounts.amountY > request.maxAmountY)
    {
        return POOL_SLIPPAGE_EXCEEDED;
    }
    if (amounts.amountX == 0 || amounts.amountY == 0)
    {
        return POOL_INVALID_AMOUNT;
    }
    return POOL_SUCCESS;
}

PoolResultCode
PoolGuard::checkBounds(WithdrawRequest const& request,
                       CurveResult const& amounts)
{
    if (amounts.amountX < request.minAmountX ||
        amounts.amountY < request.minAmountY)
    {
        return POOL_SLIPPAGE_EXCEEDED;
    }
    if (amounts.amountX == 0 || amounts.amountY == 0)
    {
        return POOL_INVALID_AMOUNT;
    }
    return POOL_SUCCESS;
}

PoolResultCode
PoolGuard::checkBounds(SwapRequest const& request, SwapResult const& amounts)
{
    if (amounts.withdraw < request.minOutput)
    {
        return POOL_SLIPPAGE_EXCEEDED;
    }
    if (amounts.deposit == 0 || amounts.withdraw == 0)
    {
        return POOL_INVALID_AMOUNT;
    }
    return POOL_SUCCESS;
}
}
