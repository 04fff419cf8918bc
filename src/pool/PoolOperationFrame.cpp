// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolOperationFrame.h"
#include "ledger/AbstractPoolLedger.h"
#include "pool/LiquidityPoolDepositOpFrame.h"
#include "pool/LiquidityPoolSwapOpFrame.h"
#include "pool/LiquidityPoolWithdrawOpFrame.h"
#include "pool/PoolGuard.h"
#include "util/Logging.h"

#include <stdexcept>

namespace cpamm
{

std::shared_ptr<PoolOperationFrame>
PoolOperationFrame::makeHelper(PoolOperation const& op)
{
    switch (op.type())
    {
    case POOL_DEPOSIT:
        return std::make_shared<LiquidityPoolDepositOpFrame>(op);
    case POOL_WITHDRAW:
        return std::make_shared<LiquidityPoolWithdrawOpFrame>(op);
    case POOL_SWAP:
        return std::make_shared<LiquidityPoolSwapOpFrame>(op);
    default:
        throw std::runtime_error("Unknown pool operation type");
    }
}

PoolOperationFrame::PoolOperationFrame(PoolOperation const& op)
    : mOperation(op)
{
}

void
PoolOperationFrame::resetResult(PoolOperationResult& res) const
{
    res = PoolOperationResult{};
    res.type = mOperation.type();
    res.code = POOL_SUCCESS;
}

bool
PoolOperationFrame::fail(PoolOperationResult& res, PoolResultCode code) const
{
    res.code = code;
    res.effects.clear();
    CLOG_DEBUG(Pool, "{} rejected: {}", toString(mOperation.type()),
               toString(code));
    return false;
}

bool
PoolOperationFrame::checkValid(PoolSnapshot const& snapshot,
                               PoolOperationResult& res) const
{
    resetResult(res);
    PoolGuard::checkPoolState(snapshot);

    auto code = PoolGuard::checkNotLocked(snapshot);
    if (code != POOL_SUCCESS)
    {
        return fail(res, code);
    }

    return doCheckValid(res);
}

bool
PoolOperationFrame::quote(PoolSnapshot const& snapshot,
                          PoolOperationResult& res) const
{
    if (!checkValid(snapshot, res))
    {
        return false;
    }
    return doQuote(snapshot, res);
}

bool
PoolOperationFrame::apply(AbstractPoolLedger& ledger,
                          PoolOperationResult& res) const
{
    auto snapshot = ledger.loadSnapshot();
    CLOG_TRACE(Pool, "apply {} on {}", toString(mOperation.type()),
               toString(snapshot));

    if (!quote(snapshot, res))
    {
        return false;
    }

    for (auto const& effect : res.effects)
    {
        bool ok = false;
        switch (effect.type)
        {
        case POOL_EFFECT_TRANSFER:
            ok = ledger.transfer(effect.token, effect.from, effect.to,
                                 effect.amount);
            break;
        case POOL_EFFECT_MINT:
            ok = ledger.mint(effect.token, effect.to, effect.amount);
            break;
        case POOL_EFFECT_BURN:
            ok = ledger.burn(effect.token, effect.from, effect.amount);
            break;
        }
        if (!ok)
        {
            CLOG_DEBUG(Pool, "ledger refused '{}'", toString(effect));
            return fail(res, POOL_EFFECT_FAILED);
        }
    }

    CLOG_TRACE(Pool, "{} applied, {} effects", toString(mOperation.type()),
               res.effects.size());
    return true;
}
}
