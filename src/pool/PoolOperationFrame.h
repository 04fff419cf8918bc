#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"

#include <memory>

namespace cpamm
{
class AbstractPoolLedger;

class PoolOperationFrame
{
  protected:
    PoolOperation const mOperation;

    // request validation that does not depend on the pool contents
    virtual bool doCheckValid(PoolOperationResult& res) const = 0;

    // runs the curve against the snapshot, checks the caller's bounds and
    // fills the amounts and the effects of res
    virtual bool doQuote(PoolSnapshot const& snapshot,
                         PoolOperationResult& res) const = 0;

    void resetResult(PoolOperationResult& res) const;
    bool fail(PoolOperationResult& res, PoolResultCode code) const;

  public:
    static std::shared_ptr<PoolOperationFrame>
    makeHelper(PoolOperation const& op);

    explicit PoolOperationFrame(PoolOperation const& op);
    PoolOperationFrame(PoolOperationFrame const&) = delete;
    virtual ~PoolOperationFrame() = default;

    // throws std::runtime_error if the snapshot is corrupted
    bool checkValid(PoolSnapshot const& snapshot,
                    PoolOperationResult& res) const;

    // evaluates the operation against a snapshot without touching a ledger
    bool quote(PoolSnapshot const& snapshot, PoolOperationResult& res) const;

    // Quotes against the ledger's snapshot and executes the effects through
    // it. Effects executed before a refused one are not undone here, callers
    // run apply inside a ledger transaction they can roll back.
    bool apply(AbstractPoolLedger& ledger, PoolOperationResult& res) const;

    PoolOperation const&
    getOperation() const
    {
        return mOperation;
    }
};
}
