#pragma once

// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"

namespace cpamm
{

// The capability the pool operations act through. POOL_PARTY_USER is the
// account the ledger is bound to, POOL_PARTY_VAULT the pool's custody. Every
// primitive either succeeds completely or returns false and changes nothing.
class AbstractPoolLedger
{
  public:
    virtual ~AbstractPoolLedger()
    {
    }

    virtual PoolSnapshot loadSnapshot() const = 0;

    // moves amount of X or Y between the user and the vault
    virtual bool transfer(PoolToken token, PoolParty from, PoolParty to,
                          uint64_t amount) = 0;

    // creates amount pool shares held by `to`
    virtual bool mint(PoolToken token, PoolParty to, uint64_t amount) = 0;

    // destroys amount pool shares held by `from`
    virtual bool burn(PoolToken token, PoolParty from, uint64_t amount) = 0;
};
}
