#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolOperationFrame.h"

namespace cpamm
{

class LiquidityPoolWithdrawOpFrame : public PoolOperationFrame
{
    WithdrawRequest const& mLiquidityPoolWithdraw;

  protected:
    bool doCheckValid(PoolOperationResult& res) const override;
    bool doQuote(PoolSnapshot const& snapshot,
                 PoolOperationResult& res) const override;

  public:
    explicit LiquidityPoolWithdrawOpFrame(PoolOperation const& op);
};
}
