// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/ConstantProductInvariant.h"
#include "invariant/InvariantManager.h"
#include "ledger/PoolLedgerTxn.h"
#include "util/numeric128.h"
#include <fmt/format.h>

namespace cpamm
{

std::shared_ptr<Invariant>
ConstantProductInvariant::registerInvariant(InvariantManager& invariantManager)
{
    return invariantManager.registerInvariant<ConstantProductInvariant>();
}

std::string
ConstantProductInvariant::getName() const
{
    return "ConstantProductInvariant";
}

namespace
{

bool
validateConstantProduct(uint64_t currentReserveX, uint64_t currentReserveY,
                        uint64_t previousReserveX, uint64_t previousReserveY)
{
    return bigMultiplyUnsigned(currentReserveX, currentReserveY) >=
           bigMultiplyUnsigned(previousReserveX, previousReserveY);
}

bool
validateReservePerShare(uint64_t currentReserve, uint64_t currentShares,
                        uint64_t previousReserve, uint64_t previousShares)
{
    // currentReserve / currentShares >= previousReserve / previousShares
    return bigMultiplyUnsigned(currentReserve, previousShares) >=
           bigMultiplyUnsigned(previousReserve, currentShares);
}
}

std::string
ConstantProductInvariant::checkOnOperationApply(
    PoolOperation const& operation, PoolOperationResult const& result,
    PoolLedgerTxnDelta const& ltxDelta)
{
    auto const& current = ltxDelta.pool.current;
    auto const& previous = ltxDelta.pool.previous;

    if (current.totalPoolShares == previous.totalPoolShares)
    {
        if (!validateConstantProduct(current.reserveX, current.reserveY,
                                     previous.reserveX, previous.reserveY))
        {
            return fmt::format("Constant product invariant violated. crX={}, "
                               "crY={}, prX={}, prY={}",
                               current.reserveX, current.reserveY,
                               previous.reserveX, previous.reserveY);
        }
        return {};
    }

    // first deposit and last withdrawal have nothing to compare against
    if (current.totalPoolShares == 0 || previous.totalPoolShares == 0)
    {
        return {};
    }

    if (!validateReservePerShare(current.reserveX, current.totalPoolShares,
                                 previous.reserveX,
                                 previous.totalPoolShares) ||
        !validateReservePerShare(current.reserveY, current.totalPoolShares,
                                 previous.reserveY, previous.totalPoolShares))
    {
        return fmt::format("Reserves per share decreased. crX={}, crY={}, "
                           "cs={}, prX={}, prY={}, ps={}",
                           current.reserveX, current.reserveY,
                           current.totalPoolShares, previous.reserveX,
                           previous.reserveY, previous.totalPoolShares);
    }

    return {};
}
}
