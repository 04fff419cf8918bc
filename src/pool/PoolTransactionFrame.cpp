// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTransactionFrame.h"
#include "invariant/InvariantManager.h"
#include "ledger/PoolLedgerTxn.h"
#include "pool/PoolOperationFrame.h"
#include "util/Logging.h"

namespace cpamm
{

PoolTransactionFrame::PoolTransactionFrame(
    std::string const& sourceAccount,
    std::vector<PoolOperation> const& operations)
    : mSourceAccount(sourceAccount)
{
    for (auto const& op : operations)
    {
        mOperations.push_back(PoolOperationFrame::makeHelper(op));
    }
}

bool
PoolTransactionFrame::apply(AbstractPoolLedgerTxnParent& parent,
                            InvariantManager& invariantManager,
                            PoolTransactionResult& res) const
{
    res = PoolTransactionResult{};
    if (mOperations.empty())
    {
        res.code = txMISSING_OPERATION;
        return false;
    }

    // shield the parent of any side effects with PoolLedgerTxn
    PoolLedgerTxn ltxTx(parent, mSourceAccount);
    if (!ltxTx.loadAccount(mSourceAccount))
    {
        CLOG_DEBUG(Ledger, "unknown source account {}", mSourceAccount);
        res.code = txNO_ACCOUNT;
        return false;
    }

    bool success = true;
    res.results.resize(mOperations.size());
    for (size_t i = 0; i < mOperations.size(); ++i)
    {
        auto const& op = mOperations[i];
        auto& opResult = res.results[i];

        PoolLedgerTxn ltxOp(ltxTx);
        bool opRes = op->apply(ltxOp, opResult);
        if (!opRes)
        {
            success = false;
        }

        // later operations are still evaluated, but invariants only make
        // sense while the state can still be committed
        if (success)
        {
            invariantManager.checkOnOperationApply(op->getOperation(),
                                                   opResult, ltxOp.getDelta());
        }

        if (opRes)
        {
            ltxOp.commit();
        }
    }

    if (!success)
    {
        CLOG_DEBUG(Ledger, "transaction from {} failed", mSourceAccount);
        res.code = txFAILED;
        return false;
    }

    ltxTx.commit();
    CLOG_TRACE(Ledger, "transaction from {} applied {} operations",
               mSourceAccount, mOperations.size());
    res.code = txSUCCESS;
    return true;
}
}
