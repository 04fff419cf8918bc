#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"

namespace cpamm
{

/**
 * PoolGuard is the accept/reject policy wrapped around the curve. Every
 * operation goes through it in this order:
 *
 *   1. checkPoolState  - the snapshot itself must be consistent, a corrupted
 *                        snapshot is an internal error and throws
 *   2. checkNotLocked  - POOL_LOCKED
 *   3. checkRequest    - POOL_INVALID_AMOUNT for zero request amounts
 *   (curve runs)
 *   4. checkBounds     - POOL_SLIPPAGE_EXCEEDED when the caller's bounds are
 *                        violated, then POOL_INVALID_AMOUNT for a zero leg
 *
 * The guard never mutates anything.
 */
class PoolGuard
{
  public:
    // supply is zero iff both reserves are, and the fee is at most 100%
    static bool isValidPoolState(PoolSnapshot const& snapshot);

    // throws std::runtime_error if !isValidPoolState(snapshot)
    static void checkPoolState(PoolSnapshot const& snapshot);

    static PoolResultCode checkNotLocked(PoolSnapshot const& snapshot);

    static PoolResultCode checkRequest(DepositRequest const& request);
    static PoolResultCode checkRequest(WithdrawRequest const& request);
    static PoolResultCode checkRequest(SwapRequest const& request);

    static PoolResultCode checkBounds(DepositRequest const& request,
                                      CurveResult const& amounts);
    static PoolResultCode checkBounds(WithdrawRequest const& request,
                                      CurveResult const& amounts);
    static PoolResultCode checkBounds(SwapRequest const& request,
                                      SwapResult const& amounts);
};
}
