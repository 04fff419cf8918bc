// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/LiquidityPoolDepositOpFrame.h"
#include "pool/ConstantProductCurve.h"
#include "pool/PoolGuard.h"
#include "pool/PoolOperations.h"
#include "util/numeric.h"

namespace cpamm
{

LiquidityPoolDepositOpFrame::LiquidityPoolDepositOpFrame(
    PoolOperation const& op)
    : PoolOperationFrame(op), mLiquidityPoolDeposit(mOperation.deposit())
{
}

bool
LiquidityPoolDepositOpFrame::doCheckValid(PoolOperationResult& res) const
{
    auto code = PoolGuard::checkRequest(mLiquidityPoolDeposit);
    if (code != POOL_SUCCESS)
    {
        return fail(res, code);
    }
    return true;
}

void
LiquidityPoolDepositOpFrame::depositIntoEmptyPool(CurveResult& amounts) const
{
    // the first depositor sets the price
    amounts = initializeBootstrapPrice(mLiquidityPoolDeposit.maxAmountX,
                                       mLiquidityPoolDeposit.maxAmountY);
}

bool
LiquidityPoolDepositOpFrame::depositIntoNonEmptyPool(
    CurveResult& amounts, PoolSnapshot const& snapshot,
    PoolOperationResult& res) const
{
    if (!getPoolDepositAmounts(amounts.amountX, amounts.amountY,
                               snapshot.reserveX, snapshot.reserveY,
                               snapshot.totalPoolShares,
                               mLiquidityPoolDeposit.shareAmount))
    {
        return fail(res, POOL_ARITHMETIC_OVERFLOW);
    }
    return true;
}

bool
LiquidityPoolDepositOpFrame::doQuote(PoolSnapshot const& snapshot,
                                     PoolOperationResult& res) const
{
    CurveResult amounts;
    if (snapshot.totalPoolShares != 0)
    {
        if (!depositIntoNonEmptyPool(amounts, snapshot, res))
        {
            return false;
        }
    }
    else // snapshot.totalPoolShares == 0
    {
        depositIntoEmptyPool(amounts);
    }

    // pool full
    uint64_t unused;
    if (!checkedAdd(unused, snapshot.reserveX, amounts.amountX) ||
        !checkedAdd(unused, snapshot.reserveY, amounts.amountY) ||
        !checkedAdd(unused, snapshot.totalPoolShares,
                    mLiquidityPoolDeposit.shareAmount))
    {
        return fail(res, POOL_ARITHMETIC_OVERFLOW);
    }

    auto code = PoolGuard::checkBounds(mLiquidityPoolDeposit, amounts);
    if (code != POOL_SUCCESS)
    {
        return fail(res, code);
    }

    res.amounts = amounts;
    res.shareAmount = mLiquidityPoolDeposit.shareAmount;
    res.effects = {
        PoolEffect::transfer(POOL_TOKEN_X, POOL_PARTY_USER, POOL_PARTY_VAULT,
                             amounts.amountX),
        PoolEffect::transfer(POOL_TOKEN_Y, POOL_PARTY_USER, POOL_PARTY_VAULT,
                             amounts.amountY),
        PoolEffect::mint(POOL_TOKEN_SHARE, POOL_PARTY_USER,
                         mLiquidityPoolDeposit.shareAmount)};
    return true;
}
}
