#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolOperationFrame.h"

namespace cpamm
{

// Swaps against the pre-trade reserves: the amount paid in does not move the
// reserve used to price the payout of the same swap.
class LiquidityPoolSwapOpFrame : public PoolOperationFrame
{
    SwapRequest const& mLiquidityPoolSwap;

  protected:
    bool doCheckValid(PoolOperationResult& res) const override;
    bool doQuote(PoolSnapshot const& snapshot,
                 PoolOperationResult& res) const override;

  public:
    explicit LiquidityPoolSwapOpFrame(PoolOperation const& op);
};
}
