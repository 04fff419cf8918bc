// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/PoolBalancesAreConserved.h"
#include "invariant/InvariantManager.h"
#include "ledger/PoolLedgerTxn.h"
#include "util/numeric128.h"
#include <fmt/format.h>

namespace cpamm
{

std::shared_ptr<Invariant>
PoolBalancesAreConserved::registerInvariant(InvariantManager& invariantManager)
{
    return invariantManager.registerInvariant<PoolBalancesAreConserved>();
}

std::string
PoolBalancesAreConserved::getName() const
{
    return "PoolBalancesAreConserved";
}

std::string
PoolBalancesAreConserved::checkOnOperationApply(
    PoolOperation const& operation, PoolOperationResult const& result,
    PoolLedgerTxnDelta const& ltxDelta)
{
    auto const& pool = ltxDelta.pool;

    // accounts plus vault, before and after
    uint128_t currentX(pool.current.reserveX);
    uint128_t previousX(pool.previous.reserveX);
    uint128_t currentY(pool.current.reserveY);
    uint128_t previousY(pool.previous.reserveY);
    // account shares plus the supply of the other side
    uint128_t currentShares(pool.previous.totalPoolShares);
    uint128_t previousShares(pool.current.totalPoolShares);

    for (auto const& kv : ltxDelta.accounts)
    {
        auto const& current = kv.second.current;
        auto const& previous = kv.second.previous;
        currentX += current.balanceX;
        previousX += previous.balanceX;
        currentY += current.balanceY;
        previousY += previous.balanceY;
        currentShares += current.poolShares;
        previousShares += previous.poolShares;
    }

    if (currentX != previousX)
    {
        return fmt::format("Token X is not conserved: reserve {} -> {} over "
                           "{} changed accounts",
                           pool.previous.reserveX, pool.current.reserveX,
                           ltxDelta.accounts.size());
    }
    if (currentY != previousY)
    {
        return fmt::format("Token Y is not conserved: reserve {} -> {} over "
                           "{} changed accounts",
                           pool.previous.reserveY, pool.current.reserveY,
                           ltxDelta.accounts.size());
    }
    if (currentShares != previousShares)
    {
        return fmt::format("Share supply {} -> {} does not match the shares "
                           "held by {} changed accounts",
                           pool.previous.totalPoolShares,
                           pool.current.totalPoolShares,
                           ltxDelta.accounts.size());
    }
    return {};
}
}
