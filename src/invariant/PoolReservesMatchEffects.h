#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/Invariant.h"

#include <memory>

namespace cpamm
{

class InvariantManager;

// This Invariant is used to validate that the change of the pool is exactly
// the net of the effects the operation emitted.
class PoolReservesMatchEffects : public Invariant
{
  public:
    explicit PoolReservesMatchEffects() : Invariant(true)
    {
    }

    static std::shared_ptr<Invariant>
    registerInvariant(InvariantManager& invariantManager);

    virtual std::string getName() const override;

    virtual std::string
    checkOnOperationApply(PoolOperation const& operation,
                          PoolOperationResult const& result,
                          PoolLedgerTxnDelta const& ltxDelta) override;
};
}
