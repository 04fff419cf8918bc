#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"

// Ledger-free entry points. Each evaluates one request against one snapshot
// and either returns POOL_SUCCESS with the exact amounts the caller has to
// move, or a failure code and leaves the output untouched. A snapshot that
// no pool can be in throws std::runtime_error.

namespace cpamm
{

// the amounts a first deposit into an empty pool moves: exactly the maxima
CurveResult initializeBootstrapPrice(uint64_t maxAmountX, uint64_t maxAmountY);

PoolResultCode deposit(PoolSnapshot const& snapshot,
                       DepositRequest const& request, CurveResult& amounts);

PoolResultCode withdraw(PoolSnapshot const& snapshot,
                        WithdrawRequest const& request, CurveResult& amounts);

PoolResultCode swap(PoolSnapshot const& snapshot, SwapRequest const& request,
                    SwapResult& amounts);

// the full result (amounts and effects) of any operation
PoolOperationResult quoteOperation(PoolSnapshot const& snapshot,
                                   PoolOperation const& op);
}
