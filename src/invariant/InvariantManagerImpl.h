// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#pragma once

#include "invariant/InvariantManager.h"

#include <cstdint>
#include <map>
#include <vector>

namespace cpamm
{

class InvariantManagerImpl : public InvariantManager
{
    std::map<std::string, std::shared_ptr<Invariant>> mInvariants;
    std::vector<std::shared_ptr<Invariant>> mEnabled;
    uint64_t mInvariantFailureCount;
    std::map<std::string, std::string> mFailureInformation;

  public:
    InvariantManagerImpl();

    virtual std::vector<std::string> getEnabledInvariants() const override;

    virtual uint64_t getFailureCount() const override;

    virtual std::string
    getLastFailure(std::string const& invariantName) const override;

    virtual void
    checkOnOperationApply(PoolOperation const& operation,
                          PoolOperationResult const& opres,
                          PoolLedgerTxnDelta const& ltxDelta) override;

    virtual void
    registerInvariant(std::shared_ptr<Invariant> invariant) override;

    virtual void enableInvariant(std::string const& pattern) override;

  private:
    void onInvariantFailure(std::shared_ptr<Invariant> invariant,
                            std::string const& message);

    void handleInvariantFailure(std::shared_ptr<Invariant> invariant,
                                std::string const& message) const;
};
}
