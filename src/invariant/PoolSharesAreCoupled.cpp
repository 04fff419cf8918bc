// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/PoolSharesAreCoupled.h"
#include "invariant/InvariantManager.h"
#include "ledger/PoolLedgerTxn.h"
#include "pool/PoolGuard.h"
#include <fmt/format.h>

namespace cpamm
{

std::shared_ptr<Invariant>
PoolSharesAreCoupled::registerInvariant(InvariantManager& invariantManager)
{
    return invariantManager.registerInvariant<PoolSharesAreCoupled>();
}

std::string
PoolSharesAreCoupled::getName() const
{
    return "PoolSharesAreCoupled";
}

std::string
PoolSharesAreCoupled::checkOnOperationApply(PoolOperation const& operation,
                                            PoolOperationResult const& result,
                                            PoolLedgerTxnDelta const& ltxDelta)
{
    auto const& pool = ltxDelta.pool.current;
    if (!PoolGuard::isValidPoolState(pool))
    {
        return fmt::format("Pool shares are not coupled to reserves: {}",
                           toString(pool));
    }
    return {};
}
}
