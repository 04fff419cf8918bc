// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/LiquidityPoolWithdrawOpFrame.h"
#include "pool/ConstantProductCurve.h"
#include "pool/PoolGuard.h"

namespace cpamm
{

LiquidityPoolWithdrawOpFrame::LiquidityPoolWithdrawOpFrame(
    PoolOperation const& op)
    : PoolOperationFrame(op), mLiquidityPoolWithdraw(mOperation.withdraw())
{
}

bool
LiquidityPoolWithdrawOpFrame::doCheckValid(PoolOperationResult& res) const
{
    auto code = PoolGuard::checkRequest(mLiquidityPoolWithdraw);
    if (code != POOL_SUCCESS)
    {
        return fail(res, code);
    }
    return true;
}

bool
LiquidityPoolWithdrawOpFrame::doQuote(PoolSnapshot const& snapshot,
                                      PoolOperationResult& res) const
{
    if (snapshot.totalPoolShares == 0 ||
        mLiquidityPoolWithdraw.shareAmount > snapshot.totalPoolShares)
    {
        return fail(res, POOL_INSUFFICIENT_LIQUIDITY);
    }

    CurveResult amounts;
    amounts.amountX = getPoolWithdrawalAmount(
        mLiquidityPoolWithdraw.shareAmount, snapshot.totalPoolShares,
        snapshot.reserveX);
    amounts.amountY = getPoolWithdrawalAmount(
        mLiquidityPoolWithdraw.shareAmount, snapshot.totalPoolShares,
        snapshot.reserveY);

    auto code = PoolGuard::checkBounds(mLiquidityPoolWithdraw, amounts);
    if (code != POOL_SUCCESS)
    {
        return fail(res, code);
    }

    res.amounts = amounts;
    res.shareAmount = mLiquidityPoolWithdraw.shareAmount;
    res.effects = {
        PoolEffect::transfer(POOL_TOKEN_X, POOL_PARTY_VAULT, POOL_PARTY_USER,
                             amounts.amountX),
        PoolEffect::transfer(POOL_TOKEN_Y, POOL_PARTY_VAULT, POOL_PARTY_USER,
                             amounts.amountY),
        PoolEffect::burn(POOL_TOKEN_SHARE, POOL_PARTY_USER,
                         mLiquidityPoolWithdraw.shareAmount)};
    return true;
}
}
