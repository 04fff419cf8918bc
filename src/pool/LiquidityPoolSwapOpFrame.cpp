// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/LiquidityPoolSwapOpFrame.h"
#include "pool/ConstantProductCurve.h"
#include "pool/PoolGuard.h"

namespace cpamm
{

LiquidityPoolSwapOpFrame::LiquidityPoolSwapOpFrame(PoolOperation const& op)
    : PoolOperationFrame(op), mLiquidityPoolSwap(mOperation.swap())
{
}

bool
LiquidityPoolSwapOpFrame::doCheckValid(PoolOperationResult& res) const
{
    auto code = PoolGuard::checkRequest(mLiquidityPoolSwap);
    if (code != POOL_SUCCESS)
    {
        return fail(res, code);
    }
    return true;
}

bool
LiquidityPoolSwapOpFrame::doQuote(PoolSnapshot const& snapshot,
                                  PoolOperationResult& res) const
{
    bool sellingX = mLiquidityPoolSwap.inputSide == POOL_ASSET_X;
    uint64_t reserveIn = sellingX ? snapshot.reserveX : snapshot.reserveY;
    uint64_t reserveOut = sellingX ? snapshot.reserveY : snapshot.reserveX;

    SwapResult amounts;
    amounts.deposit = mLiquidityPoolSwap.inputAmount;
    auto code = exchangeWithPool(reserveIn, reserveOut, amounts.deposit,
                                 snapshot.feeBps, amounts.withdraw);
    if (code != POOL_SUCCESS)
    {
        return fail(res, code);
    }

    code = PoolGuard::checkBounds(mLiquidityPoolSwap, amounts);
    if (code != POOL_SUCCESS)
    {
        return fail(res, code);
    }

    auto tokenIn = toPoolToken(mLiquidityPoolSwap.inputSide);
    auto tokenOut = toPoolToken(otherAsset(mLiquidityPoolSwap.inputSide));

    res.swap = amounts;
    res.effects = {PoolEffect::transfer(tokenIn, POOL_PARTY_USER,
                                        POOL_PARTY_VAULT, amounts.deposit),
                   PoolEffect::transfer(tokenOut, POOL_PARTY_VAULT,
                                        POOL_PARTY_USER, amounts.withdraw)};
    return true;
}
}
