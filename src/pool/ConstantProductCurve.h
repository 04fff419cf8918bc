#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"

#include <cstdint>

// Stateless pricing for a two-asset constant-product pool. Every function is
// exact integer arithmetic over 128-bit intermediates; rounding always favors
// the pool.

namespace cpamm
{

// Amounts a depositor pays for shareAmount new shares of a non-empty pool:
//   amountX = ceil(reserveX * shareAmount / totalPoolShares)
//   amountY = ceil(reserveY * shareAmount / totalPoolShares)
// totalPoolShares must be non-zero. Returns false if an amount does not fit
// in 64 bits.
bool getPoolDepositAmounts(uint64_t& amountX, uint64_t& amountY,
                           uint64_t reserveX, uint64_t reserveY,
                           uint64_t totalPoolShares, uint64_t shareAmount);

// floor(reserve * amountPoolShares / totalPoolShares). Requires
// amountPoolShares <= totalPoolShares, so the result never exceeds reserve.
uint64_t getPoolWithdrawalAmount(uint64_t amountPoolShares,
                                 uint64_t totalPoolShares, uint64_t reserve);

// floor(amount * (10000 - feeBps) / 10000)
uint64_t getAmountAfterFee(uint64_t amount, uint32_t feeBps);

// Prices a swap of amountIn against the pre-trade reserves:
//   effective = getAmountAfterFee(amountIn, feeBps)
//   amountOut = floor(reserveOut - reserveIn * reserveOut /
//                                  (reserveIn + effective))
// which is computed as floor(reserveOut * effective / (reserveIn + effective))
// so that reserveIn' * reserveOut' never drops below reserveIn * reserveOut.
//
// Fails with POOL_UNDEFINED_PRICE if either reserve is empty,
// POOL_ARITHMETIC_OVERFLOW if the input reserve could not hold amountIn,
// POOL_INVALID_AMOUNT if the fee consumes the whole input and
// POOL_INSUFFICIENT_LIQUIDITY if the pool cannot pay amountOut.
PoolResultCode exchangeWithPool(uint64_t reserveIn, uint64_t reserveOut,
                                uint64_t amountIn, uint32_t feeBps,
                                uint64_t& amountOut);

// floor(sqrt(amountX * amountY)), a share amount for the first deposit that
// does not depend on the unit of either token.
uint64_t getBootstrapShareAmount(uint64_t amountX, uint64_t amountY);

// Price of one unit of `side` expressed in the other token, as a fixed-point
// integer with snapshot.shareDecimals decimals (rounded down).
PoolResultCode getSpotPrice(PoolSnapshot const& snapshot, PoolAsset side,
                            uint64_t& price);
}
