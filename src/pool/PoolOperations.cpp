// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolOperations.h"
#include "pool/PoolOperationFrame.h"

namespace cpamm
{

CurveResult
initializeBootstrapPrice(uint64_t maxAmountX, uint64_t maxAmountY)
{
    CurveResult res;
    res.amountX = maxAmountX;
    res.amountY = maxAmountY;
    return res;
}

PoolOperationResult
quoteOperation(PoolSnapshot const& snapshot, PoolOperation const& op)
{
    PoolOperationResult res;
    PoolOperationFrame::makeHelper(op)->quote(snapshot, res);
    return res;
}

PoolResultCode
deposit(PoolSnapshot const& snapshot, DepositRequest const& request,
        CurveResult& amounts)
{
    PoolOperation op;
    op.body = request;
    auto res = quoteOperation(snapshot, op);
    if (res.code == POOL_SUCCESS)
    {
        amounts = res.amounts;
    }
    return res.code;
}

PoolResultCode
withdraw(PoolSnapshot const& snapshot, WithdrawRequest const& request,
         CurveResult& amounts)
{
    PoolOperation op;
    op.body = request;
    auto res = quoteOperation(snapshot, op);
    if (res.code == POOL_SUCCESS)
    {
        amounts = res.amounts;
    }
    return res.code;
}

PoolResultCode
swap(PoolSnapshot const& snapshot, SwapRequest const& request,
     SwapResult& amounts)
{
    PoolOperation op;
    op.body = request;
    auto res = quoteOperation(snapshot, op);
    if (res.code == POOL_SUCCESS)
    {
        amounts = res.swap;
    }
    return res.code;
}
}
