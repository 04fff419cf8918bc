#pragma once

// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/AbstractPoolLedger.h"
#include "pool/PoolTypes.h"

#include <map>
#include <string>

// In-memory reference implementation of the account layer the pool core
// talks to.
//
// A PoolLedgerTxnRoot holds committed state: the pool (whose reserves are
// the vault balances) and every account's balances of X, Y and pool shares.
// A PoolLedgerTxn is opened on a parent (the root or another PoolLedgerTxn),
// works on its own copy of the parent's state, and either commits that state
// into the parent or is rolled back, which is also what happens when it is
// destroyed without having been committed. A parent has at most one open
// child and cannot be used while the child is open.
//
// Every PoolLedgerTxn is bound to a source account: POOL_PARTY_USER in the
// AbstractPoolLedger primitives refers to it.

namespace cpamm
{

class PoolLedgerTxn;

struct PoolAccountEntry
{
    uint64_t balanceX{0};
    uint64_t balanceY{0};
    uint64_t poolShares{0};

    bool operator==(PoolAccountEntry const& other) const;
    bool operator!=(PoolAccountEntry const& other) const;
};

struct PoolLedgerState
{
    PoolSnapshot pool;
    std::map<std::string, PoolAccountEntry> accounts;
};

struct PoolLedgerTxnDelta
{
    struct PoolDelta
    {
        PoolSnapshot current;
        PoolSnapshot previous;
    };

    struct AccountDelta
    {
        PoolAccountEntry current;
        PoolAccountEntry previous;
    };

    PoolDelta pool;
    // only accounts whose balances changed
    std::map<std::string, AccountDelta> accounts;
};

class AbstractPoolLedgerTxnParent
{
  public:
    virtual ~AbstractPoolLedgerTxnParent();

    // Called by a PoolLedgerTxn when it is opened on this parent. Throws if
    // the parent already has a child.
    virtual void addChild(PoolLedgerTxn& child) = 0;

    // Replaces the state of this parent with the state of its only child and
    // forgets the child.
    virtual void commitChild(PoolLedgerState const& state) = 0;
    virtual void rollbackChild() = 0;

    // state a new child starts from
    virtual PoolLedgerState const& getState() const = 0;
};

class PoolLedgerTxn final : public AbstractPoolLedgerTxnParent,
                            public AbstractPoolLedger
{
    AbstractPoolLedgerTxnParent& mParent;
    PoolLedgerTxn* mChild;
    std::string const mSourceAccount;
    PoolLedgerState const mPrevious;
    PoolLedgerState mState;
    bool mIsSealed;

    void throwIfChild() const;
    void throwIfSealed() const;

    PoolAccountEntry* loadSourceEntry();
    uint64_t& vaultBalance(PoolToken token);

  public:
    PoolLedgerTxn(AbstractPoolLedgerTxnParent& parent,
                  std::string const& sourceAccount);
    // nested transaction with the same source account
    explicit PoolLedgerTxn(PoolLedgerTxn& parent);

    PoolLedgerTxn(PoolLedgerTxn const&) = delete;
    PoolLedgerTxn& operator=(PoolLedgerTxn const&) = delete;

    virtual ~PoolLedgerTxn();

    void commit();
    void rollback();

    void addChild(PoolLedgerTxn& child) override;
    void commitChild(PoolLedgerState const& state) override;
    void rollbackChild() override;
    PoolLedgerState const& getState() const override;

    PoolSnapshot loadSnapshot() const override;
    bool transfer(PoolToken token, PoolParty from, PoolParty to,
                  uint64_t amount) override;
    bool mint(PoolToken token, PoolParty to, uint64_t amount) override;
    bool burn(PoolToken token, PoolParty from, uint64_t amount) override;

    // nullptr if the account does not exist
    PoolAccountEntry const* loadAccount(std::string const& name) const;

    std::string const&
    getSourceAccount() const
    {
        return mSourceAccount;
    }

    // changes relative to the parent's state when this was opened
    PoolLedgerTxnDelta getDelta() const;
};

class PoolLedgerTxnRoot : public AbstractPoolLedgerTxnParent
{
    PoolLedgerState mState;
    PoolLedgerTxn* mChild;

    void throwIfChild() const;

  public:
    explicit PoolLedgerTxnRoot(uint32_t feeBps,
                               uint32_t shareDecimals = DEFAULT_SHARE_DECIMALS,
                               bool locked = false);

    virtual ~PoolLedgerTxnRoot();

    void addChild(PoolLedgerTxn& child) override;
    void commitChild(PoolLedgerState const& state) override;
    void rollbackChild() override;
    PoolLedgerState const& getState() const override;

    // throws if the account exists or a child is open
    void createAccount(std::string const& name, uint64_t balanceX,
                       uint64_t balanceY);

    // administrative lock, throws if a child is open
    void setLocked(bool locked);

    PoolSnapshot const& getSnapshot() const;
    PoolAccountEntry const* loadAccount(std::string const& name) const;
};
}
