// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/TestExceptions.h"

namespace cpamm
{

namespace txtest
{

void
throwIf(PoolResultCode code)
{
    switch (code)
    {
    case POOL_LOCKED:
        throw ex_POOL_LOCKED{};
    case POOL_INVALID_AMOUNT:
        throw ex_POOL_INVALID_AMOUNT{};
    case POOL_SLIPPAGE_EXCEEDED:
        throw ex_POOL_SLIPPAGE_EXCEEDED{};
    case POOL_ARITHMETIC_OVERFLOW:
        throw ex_POOL_ARITHMETIC_OVERFLOW{};
    case POOL_UNDEFINED_PRICE:
        throw ex_POOL_UNDEFINED_PRICE{};
    case POOL_INSUFFICIENT_LIQUIDITY:
        throw ex_POOL_INSUFFICIENT_LIQUIDITY{};
    case POOL_EFFECT_FAILED:
        throw ex_POOL_EFFECT_FAILED{};
    case POOL_SUCCESS:
        break;
    default:
        throw ex_UNKNOWN{};
    }
}

void
throwIf(PoolOperationResult const& result)
{
    throwIf(result.code);
}

void
throwIf(PoolTransactionResult const& result)
{
    switch (result.code)
    {
    case txSUCCESS:
        break;
    case txMISSING_OPERATION:
        throw ex_txMISSING_OPERATION{};
    case txNO_ACCOUNT:
        throw ex_txNO_ACCOUNT{};
    case txFAILED:
        for (auto const& opResult : result.results)
        {
            throwIf(opResult);
        }
        throw ex_txFAILED{};
    default:
        throw ex_UNKNOWN{};
    }
}
}
}
