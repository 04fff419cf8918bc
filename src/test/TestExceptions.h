#pragma once

// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"

namespace cpamm
{

namespace txtest
{

class ex_txFAILED
{
};
class ex_txMISSING_OPERATION
{
};
class ex_txNO_ACCOUNT
{
};

class ex_POOL_LOCKED
{
};
class ex_POOL_INVALID_AMOUNT
{
};
class ex_POOL_SLIPPAGE_EXCEEDED
{
};
class ex_POOL_ARITHMETIC_OVERFLOW
{
};
class ex_POOL_UNDEFINED_PRICE
{
};
class ex_POOL_INSUFFICIENT_LIQUIDITY
{
};
class ex_POOL_EFFECT_FAILED
{
};

class ex_UNKNOWN
{
};

void throwIf(PoolResultCode code);
void throwIf(PoolOperationResult const& result);

// throws the exception of the first failed operation if there is one,
// ex_txFAILED otherwise
void throwIf(PoolTransactionResult const& result);
}
}
