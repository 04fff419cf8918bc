#pragma once

// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <memory>
#include <string>
#include <vector>

namespace cpamm
{

class Invariant;
struct PoolLedgerTxnDelta;
struct PoolOperation;
struct PoolOperationResult;

/**
 * InvariantManager maintains a registry of available invariants and
 * supports enabling them dynamically, such as at configuration time.
 * When an operation is applied the InvariantManager checks each of the
 * enabled invariants and throws InvariantDoesNotHold if a strict one is
 * violated.
 */
class InvariantManager
{
  public:
    static std::unique_ptr<InvariantManager> create();

    virtual ~InvariantManager()
    {
    }

    virtual std::vector<std::string> getEnabledInvariants() const = 0;

    // number of failed checks, strict or not
    virtual uint64_t getFailureCount() const = 0;

    // message of the last failure of the named invariant, empty if none
    virtual std::string
    getLastFailure(std::string const& invariantName) const = 0;

    virtual void checkOnOperationApply(PoolOperation const& operation,
                                       PoolOperationResult const& opres,
                                       PoolLedgerTxnDelta const& ltxDelta) = 0;

    virtual void registerInvariant(std::shared_ptr<Invariant> invariant) = 0;

    // enables every registered invariant whose name matches the
    // case-insensitive regular expression
    virtual void enableInvariant(std::string const& pattern) = 0;

    template <typename T, typename... Args>
    std::shared_ptr<T>
    registerInvariant(Args&&... args)
    {
        auto invariant = std::make_shared<T>(std::forward<Args>(args)...);
        registerInvariant(invariant);
        return invariant;
    }
};

// registers every pool invariant with the manager
void registerPoolInvariants(InvariantManager& invariantManager);
}
