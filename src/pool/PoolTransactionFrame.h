#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"

#include <memory>
#include <string>
#include <vector>

namespace cpamm
{
class AbstractPoolLedgerTxnParent;
class InvariantManager;
class PoolOperationFrame;

// An ordered list of pool operations submitted by one account, applied all
// or nothing.
class PoolTransactionFrame
{
    std::string const mSourceAccount;
    std::vector<std::shared_ptr<PoolOperationFrame>> mOperations;

  public:
    PoolTransactionFrame(std::string const& sourceAccount,
                         std::vector<PoolOperation> const& operations);

    std::string const&
    getSourceAccount() const
    {
        return mSourceAccount;
    }

    std::vector<std::shared_ptr<PoolOperationFrame>> const&
    getOperations() const
    {
        return mOperations;
    }

    // Applies every operation in its own nested ledger transaction and runs
    // the enabled invariants after each one that succeeded. Commits into
    // parent only if all of them succeeded. Every operation is evaluated
    // even after a failure so res reports all of them.
    // Throws InvariantDoesNotHold if a strict invariant is violated, in
    // which case nothing is committed either.
    bool apply(AbstractPoolLedgerTxnParent& parent,
               InvariantManager& invariantManager,
               PoolTransactionResult& res) const;
};
}
