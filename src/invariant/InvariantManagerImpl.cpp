// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/InvariantManagerImpl.h"
#include "invariant/ConstantProductInvariant.h"
#include "invariant/Invariant.h"
#include "invariant/InvariantDoesNotHold.h"
#include "invariant/PoolBalancesAreConserved.h"
#include "invariant/PoolReservesMatchEffects.h"
#include "invariant/PoolSharesAreCoupled.h"
#include "ledger/PoolLedgerTxn.h"
#include "pool/PoolTypes.h"
#include "util/Logging.h"

#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <numeric>
#include <regex>

namespace cpamm
{

std::unique_ptr<InvariantManager>
InvariantManager::create()
{
    return std::make_unique<InvariantManagerImpl>();
}

void
registerPoolInvariants(InvariantManager& invariantManager)
{
    ConstantProductInvariant::registerInvariant(invariantManager);
    PoolSharesAreCoupled::registerInvariant(invariantManager);
    PoolReservesMatchEffects::registerInvariant(invariantManager);
    PoolBalancesAreConserved::registerInvariant(invariantManager);
}

InvariantManagerImpl::InvariantManagerImpl() : mInvariantFailureCount(0)
{
}

std::vector<std::string>
InvariantManagerImpl::getEnabledInvariants() const
{
    std::vector<std::string> res;
    for (auto const& p : mEnabled)
    {
        res.emplace_back(p->getName());
    }
    return res;
}

uint64_t
InvariantManagerImpl::getFailureCount() const
{
    return mInvariantFailureCount;
}

std::string
InvariantManagerImpl::getLastFailure(std::string const& invariantName) const
{
    auto it = mFailureInformation.find(invariantName);
    return it == mFailureInformation.end() ? std::string{} : it->second;
}

void
InvariantManagerImpl::checkOnOperationApply(PoolOperation const& operation,
                                            PoolOperationResult const& opres,
                                            PoolLedgerTxnDelta const& ltxDelta)
{
    for (auto invariant : mEnabled)
    {
        auto result =
            invariant->checkOnOperationApply(operation, opres, ltxDelta);
        if (result.empty())
        {
            continue;
        }

        auto message = fmt::format(
            R"(Invariant "{}" does not hold on operation {}: {}{}{} -> {})",
            invariant->getName(), toString(operation.type()), result, "\n",
            toString(ltxDelta.pool.previous), toString(ltxDelta.pool.current));
        onInvariantFailure(invariant, message);
    }
}

void
InvariantManagerImpl::registerInvariant(std::shared_ptr<Invariant> invariant)
{
    auto name = invariant->getName();
    auto iter = mInvariants.find(name);
    if (iter == mInvariants.end())
    {
        mInvariants[name] = invariant;
    }
    else
    {
        throw std::runtime_error{"Invariant " + invariant->getName() +
                                 " already registered"};
    }
}

void
InvariantManagerImpl::enableInvariant(std::string const& invPattern)
{
    if (invPattern.empty())
    {
        throw std::invalid_argument("Invariant pattern must be non empty");
    }

    std::regex r;
    try
    {
        r = std::regex(invPattern, std::regex::ECMAScript | std::regex::icase);
    }
    catch (std::regex_error& e)
    {
        throw std::invalid_argument(fmt::format(
            "Invalid invariant pattern '{}': {}", invPattern, e.what()));
    }

    bool enabledSome = false;
    for (auto const& inv : mInvariants)
    {
        auto const& name = inv.first;
        if (std::regex_match(name, r, std::regex_constants::match_not_null))
        {
            auto iter = std::find(mEnabled.begin(), mEnabled.end(), inv.second);
            if (iter == mEnabled.end())
            {
                enabledSome = true;
                mEnabled.push_back(inv.second);
                CLOG_INFO(Invariant, "Enabled invariant '{}'", name);
            }
            else
            {
                throw std::runtime_error{"Invariant " + name +
                                         " already enabled"};
            }
        }
    }
    if (!enabledSome)
    {
        std::string message = fmt::format(
            "Invariant pattern '{}' did not match any invariants.", invPattern);
        if (mInvariants.size() > 0)
        {
            using value_type = decltype(mInvariants)::value_type;
            std::string registered = std::accumulate(
                std::next(mInvariants.cbegin()), mInvariants.cend(),
                mInvariants.cbegin()->first,
                [](std::string const& lhs, value_type const& rhs) {
                    return lhs + ", " + rhs.first;
                });
            message += " Registered invariants are: " + registered;
        }
        else
        {
            message += " There are no registered invariants";
        }
        throw std::runtime_error{message};
    }
}

void
InvariantManagerImpl::onInvariantFailure(std::shared_ptr<Invariant> invariant,
                                         std::string const& message)
{
    ++mInvariantFailureCount;
    mFailureInformation[invariant->getName()] = message;
    handleInvariantFailure(invariant, message);
}

void
InvariantManagerImpl::handleInvariantFailure(
    std::shared_ptr<Invariant> invariant, std::string const& message) const
{
    if (invariant->isStrict())
    {
        CLOG_FATAL(Invariant, "{}", message);
        throw InvariantDoesNotHold{message};
    }
    else
    {
        CLOG_ERROR(Invariant, "{}", message);
    }
}
}
