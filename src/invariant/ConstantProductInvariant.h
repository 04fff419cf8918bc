#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/Invariant.h"

#include <cstdint>
#include <memory>

namespace cpamm
{

class InvariantManager;

// This Invariant is used to validate that the product of the reserves does
// not decrease when the share supply is unchanged, and that the reserves per
// share do not decrease when it changed.
class ConstantProductInvariant : public Invariant
{
  public:
    explicit ConstantProductInvariant() : Invariant(true)
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

bool validateConstantProduct(uint64_t currentReserveX, uint64_t currentReserveY,
                             uint64_t previousReserveX,
                             uint64_t previousReserveY);

bool validateReservePerShare(uint64_t currentReserve, uint64_t currentShares,
                             uint64_t previousReserve, uint64_t previousShares);
}
