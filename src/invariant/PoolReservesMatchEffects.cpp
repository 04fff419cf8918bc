// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/PoolReservesMatchEffects.h"
#include "invariant/InvariantManager.h"
#include "ledger/PoolLedgerTxn.h"
#include "util/numeric128.h"
#include <fmt/format.h>

#include <array>

namespace cpamm
{

namespace
{
// amounts into and out of the vault, indexed by PoolToken, where for
// POOL_TOKEN_SHARE "in" means minted and "out" means burned
struct EffectTotals
{
    std::array<uint128_t, 3> in{};
    std::array<uint128_t, 3> out{};
};

EffectTotals
sumEffects(std::vector<PoolEffect> const& effects)
{
    EffectTotals totals;
    for (auto const& effect : effects)
    {
        switch (effect.type)
        {
        case POOL_EFFECT_TRANSFER:
            if (effect.to == POOL_PARTY_VAULT)
            {
                totals.in[effect.token] += effect.amount;
            }
            else
            {
                totals.out[effect.token] += effect.amount;
            }
            break;
        case POOL_EFFECT_MINT:
            totals.in[effect.token] += effect.amount;
            break;
        case POOL_EFFECT_BURN:
            totals.out[effect.token] += effect.amount;
            break;
        }
    }
    return totals;
}

bool
matches(uint64_t current, uint64_t previous, uint128_t const& in,
        uint128_t const& out)
{
    return uint128_t(current) + out == uint128_t(previous) + in;
}
}

std::shared_ptr<Invariant>
PoolReservesMatchEffects::registerInvariant(InvariantManager& invariantManager)
{
    return invariantManager.registerInvariant<PoolReservesMatchEffects>();
}

std::string
PoolReservesMatchEffects::getName() const
{
    return "PoolReservesMatchEffects";
}

std::string
PoolReservesMatchEffects::checkOnOperationApply(
    PoolOperation const& operation, PoolOperationResult const& result,
    PoolLedgerTxnDelta const& ltxDelta)
{
    auto const& current = ltxDelta.pool.current;
    auto const& previous = ltxDelta.pool.previous;
    auto totals = sumEffects(result.effects);

    if (!matches(current.reserveX, previous.reserveX, totals.in[POOL_TOKEN_X],
                 totals.out[POOL_TOKEN_X]))
    {
        return fmt::format(
            "Reserve X changed from {} to {} which is not the net of the "
            "effects",
            previous.reserveX, current.reserveX);
    }
    if (!matches(current.reserveY, previous.reserveY, totals.in[POOL_TOKEN_Y],
                 totals.out[POOL_TOKEN_Y]))
    {
        return fmt::format(
            "Reserve Y changed from {} to {} which is not the net of the "
            "effects",
            previous.reserveY, current.reserveY);
    }
    if (!matches(current.totalPoolShares, previous.totalPoolShares,
                 totals.in[POOL_TOKEN_SHARE], totals.out[POOL_TOKEN_SHARE]))
    {
        return fmt::format("Share supply changed from {} to {} which is not "
                           "the net of the mints and burns",
                           previous.totalPoolShares, current.totalPoolShares);
    }
    if (current.feeBps != previous.feeBps ||
        current.shareDecimals != previous.shareDecimals ||
        current.locked != previous.locked)
    {
        return fmt::format("Pool parameters changed: {} -> {}",
                           toString(previous), toString(current));
    }
    return {};
}
}
