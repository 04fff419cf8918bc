#pragma once

// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <string>

namespace cpamm
{

struct PoolLedgerTxnDelta;
struct PoolOperation;
struct PoolOperationResult;

// NOTE: The checkOn* functions should have a default implementation so that
//       more can be added in the future without requiring changes to all
//       derived classes.
class Invariant
{
    bool const mStrict;

  public:
    explicit Invariant(bool strict) : mStrict(strict)
    {
    }

    virtual ~Invariant()
    {
    }

    virtual std::string getName() const = 0;

    bool
    isStrict() const
    {
        return mStrict;
    }

    // Called after an operation succeeded, with the changes it made. Returns
    // an empty string if the invariant holds, a description otherwise.
    virtual std::string
    checkOnOperationApply(PoolOperation const& operation,
                          PoolOperationResult const& result,
                          PoolLedgerTxnDelta const& ltxDelta)
    {
        return std::string{};
    }
};
}
