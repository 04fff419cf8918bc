// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/PoolLedgerTxn.h"
#include "pool/PoolGuard.h"
#include "util/Logging.h"
#include "util/types.h"

#include <stdexcept>

namespace cpamm
{

bool
PoolAccountEntry::operator==(PoolAccountEntry const& other) const
{
    return balanceX == other.balanceX && balanceY == other.balanceY &&
           poolShares == other.poolShares;
}

bool
PoolAccountEntry::operator!=(PoolAccountEntry const& other) const
{
    return !(*this == other);
}

AbstractPoolLedgerTxnParent::~AbstractPoolLedgerTxnParent()
{
}

// PoolLedgerTxn -------------------------------------------------------------

PoolLedgerTxn::PoolLedgerTxn(AbstractPoolLedgerTxnParent& parent,
                             std::string const& sourceAccount)
    : mParent(parent)
    , mChild(nullptr)
    , mSourceAccount(sourceAccount)
    , mPrevious(parent.getState())
    , mState(mPrevious)
    , mIsSealed(false)
{
    mParent.addChild(*this);
}

PoolLedgerTxn::PoolLedgerTxn(PoolLedgerTxn& parent)
    : PoolLedgerTxn(static_cast<AbstractPoolLedgerTxnParent&>(parent),
                    parent.getSourceAccount())
{
}

PoolLedgerTxn::~PoolLedgerTxn()
{
    if (!mIsSealed)
    {
        rollback();
    }
}

void
PoolLedgerTxn::throwIfChild() const
{
    if (mChild)
    {
        throw std::runtime_error("PoolLedgerTxn has child");
    }
}

void
PoolLedgerTxn::throwIfSealed() const
{
    if (mIsSealed)
    {
        throw std::runtime_error("PoolLedgerTxn was handled");
    }
}

void
PoolLedgerTxn::commit()
{
    throwIfSealed();
    throwIfChild();
    CLOG_TRACE(Ledger, "commit {}: {}", mSourceAccount, toString(mState.pool));
    mParent.commitChild(mState);
    mIsSealed = true;
}

void
PoolLedgerTxn::rollback()
{
    throwIfSealed();
    if (mChild)
    {
        mChild->rollback();
    }
    mParent.rollbackChild();
    mIsSealed = true;
}

void
PoolLedgerTxn::addChild(PoolLedgerTxn& child)
{
    throwIfSealed();
    throwIfChild();
    mChild = &child;
}

void
PoolLedgerTxn::commitChild(PoolLedgerState const& state)
{
    mState = state;
    mChild = nullptr;
}

void
PoolLedgerTxn::rollbackChild()
{
    mChild = nullptr;
}

PoolLedgerState const&
PoolLedgerTxn::getState() const
{
    throwIfSealed();
    throwIfChild();
    return mState;
}

PoolSnapshot
PoolLedgerTxn::loadSnapshot() const
{
    throwIfSealed();
    throwIfChild();
    return mState.pool;
}

PoolAccountEntry*
PoolLedgerTxn::loadSourceEntry()
{
    auto it = mState.accounts.find(mSourceAccount);
    return it == mState.accounts.end() ? nullptr : &it->second;
}

uint64_t&
PoolLedgerTxn::vaultBalance(PoolToken token)
{
    return token == POOL_TOKEN_X ? mState.pool.reserveX : mState.pool.reserveY;
}

bool
PoolLedgerTxn::transfer(PoolToken token, PoolParty from, PoolParty to,
                        uint64_t amount)
{
    throwIfSealed();
    throwIfChild();

    if (token == POOL_TOKEN_SHARE || from == to)
    {
        return false;
    }

    auto source = loadSourceEntry();
    if (!source)
    {
        CLOG_DEBUG(Ledger, "transfer: no account {}", mSourceAccount);
        return false;
    }

    uint64_t& userBalance =
        token == POOL_TOKEN_X ? source->balanceX : source->balanceY;
    uint64_t newUser = userBalance;
    uint64_t newVault = vaultBalance(token);

    bool ok = from == POOL_PARTY_USER
                  ? subtractBalance(newUser, amount) &&
                        addBalance(newVault, amount)
                  : subtractBalance(newVault, amount) &&
                        addBalance(newUser, amount);
    if (!ok)
    {
        CLOG_DEBUG(Ledger, "transfer of {} {} refused for {}", amount,
                   toString(token), mSourceAccount);
        return false;
    }

    userBalance = newUser;
    vaultBalance(token) = newVault;
    return true;
}

bool
PoolLedgerTxn::mint(PoolToken token, PoolParty to, uint64_t amount)
{
    throwIfSealed();
    throwIfChild();

    if (token != POOL_TOKEN_SHARE || to != POOL_PARTY_USER)
    {
        return false;
    }

    auto source = loadSourceEntry();
    if (!source)
    {
        return false;
    }

    uint64_t shares = source->poolShares;
    uint64_t supply = mState.pool.totalPoolShares;
    if (!addBalance(shares, amount) || !addBalance(supply, amount))
    {
        CLOG_DEBUG(Ledger, "mint of {} shares refused for {}", amount,
                   mSourceAccount);
        return false;
    }

    source->poolShares = shares;
    mState.pool.totalPoolShares = supply;
    return true;
}

bool
PoolLedgerTxn::burn(PoolToken token, PoolParty from, uint64_t amount)
{
    throwIfSealed();
    throwIfChild();

    if (token != POOL_TOKEN_SHARE || from != POOL_PARTY_USER)
    {
        return false;
    }

    auto source = loadSourceEntry();
    if (!source)
    {
        return false;
    }

    uint64_t shares = source->poolShares;
    uint64_t supply = mState.pool.totalPoolShares;
    if (!subtractBalance(shares, amount) || !subtractBalance(supply, amount))
    {
        CLOG_DEBUG(Ledger, "burn of {} shares refused for {}", amount,
                   mSourceAccount);
        return false;
    }

    source->poolShares = shares;
    mState.pool.totalPoolShares = supply;
    return true;
}

PoolAccountEntry const*
PoolLedgerTxn::loadAccount(std::string const& name) const
{
    throwIfSealed();
    throwIfChild();
    auto it = mState.accounts.find(name);
    return it == mState.accounts.end() ? nullptr : &it->second;
}

PoolLedgerTxnDelta
PoolLedgerTxn::getDelta() const
{
    throwIfSealed();
    throwIfChild();

    PoolLedgerTxnDelta delta;
    delta.pool.current = mState.pool;
    delta.pool.previous = mPrevious.pool;

    for (auto const& kv : mState.accounts)
    {
        PoolAccountEntry previous;
        auto it = mPrevious.accounts.find(kv.first);
        if (it != mPrevious.accounts.end())
        {
            previous = it->second;
        }
        if (previous != kv.second)
        {
            delta.accounts[kv.first] = {kv.second, previous};
        }
    }
    return delta;
}

// PoolLedgerTxnRoot ---------------------------------------------------------

PoolLedgerTxnRoot::PoolLedgerTxnRoot(uint32_t feeBps, uint32_t shareDecimals,
                                     bool locked)
    : mChild(nullptr)
{
    mState.pool.feeBps = feeBps;
    mState.pool.shareDecimals = shareDecimals;
    mState.pool.locked = locked;
    PoolGuard::checkPoolState(mState.pool);
}

PoolLedgerTxnRoot::~PoolLedgerTxnRoot()
{
}

void
PoolLedgerTxnRoot::throwIfChild() const
{
    if (mChild)
    {
        throw std::runtime_error("PoolLedgerTxnRoot has child");
    }
}

void
PoolLedgerTxnRoot::addChild(PoolLedgerTxn& child)
{
    throwIfChild();
    mChild = &child;
}

void
PoolLedgerTxnRoot::commitChild(PoolLedgerState const& state)
{
    mState = state;
    mChild = nullptr;
}

void
PoolLedgerTxnRoot::rollbackChild()
{
    mChild = nullptr;
}

PoolLedgerState const&
PoolLedgerTxnRoot::getState() const
{
    return mState;
}

void
PoolLedgerTxnRoot::createAccount(std::string const& name, uint64_t balanceX,
                                 uint64_t balanceY)
{
    throwIfChild();
    if (name.empty())
    {
        throw std::invalid_argument("account name must be non empty");
    }

    PoolAccountEntry entry;
    entry.balanceX = balanceX;
    entry.balanceY = balanceY;
    if (!mState.accounts.emplace(name, entry).second)
    {
        throw std::runtime_error("Account " + name + " already exists");
    }
    CLOG_DEBUG(Ledger, "Created account {} (X={}, Y={})", name, balanceX,
               balanceY);
}

void
PoolLedgerTxnRoot::setLocked(bool locked)
{
    throwIfChild();
    mState.pool.locked = locked;
}

PoolSnapshot const&
PoolLedgerTxnRoot::getSnapshot() const
{
    return mState.pool;
}

PoolAccountEntry const*
PoolLedgerTxnRoot::loadAccount(std::string const& name) const
{
    auto it = mState.accounts.find(name);
    return it == mState.accounts.end() ? nullptr : &it->second;
}
}
