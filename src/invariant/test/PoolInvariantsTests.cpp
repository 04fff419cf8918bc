// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/ConstantProductInvariant.h"
#include "invariant/PoolBalancesAreConserved.h"
#include "invariant/PoolReservesMatchEffects.h"
#include "invariant/PoolSharesAreCoupled.h"
#include "ledger/PoolLedgerTxn.h"
#include "pool/PoolOperations.h"
#include "test/Catch2.h"
#include "test/TestPool.h"

#include <limits>

using namespace cpamm;

namespace
{
PoolSnapshot
makePool(uint64_t reserveX, uint64_t reserveY, uint64_t totalPoolShares)
{
    PoolSnapshot pool;
    pool.reserveX = reserveX;
    pool.reserveY = reserveY;
    pool.totalPoolShares = totalPoolShares;
    pool.feeBps = 30;
    return pool;
}

PoolLedgerTxnDelta
makeDelta(PoolSnapshot const& previous, PoolSnapshot const& current)
{
    PoolLedgerTxnDelta delta;
    delta.pool.previous = previous;
    delta.pool.current = current;
    return delta;
}
}

TEST_CASE("constant product invariant", "[invariant][constantproduct]")
{
    ConstantProductInvariant invariant;
    auto swap = PoolOperation::makeSwap(POOL_ASSET_X, 10, 0);
    PoolOperationResult res;

    SECTION("product")
    {
        REQUIRE(validateConstantProduct(10, 10, 10, 10));
        REQUIRE(validateConstantProduct(11, 10, 10, 10));
        REQUIRE(!validateConstantProduct(9, 11, 10, 10));

        uint64_t const max = std::numeric_limits<uint64_t>::max();
        REQUIRE(validateConstantProduct(max, max, max, max - 1));
        REQUIRE(!validateConstantProduct(max - 1, max, max, max));
    }

    SECTION("swap keeps the product")
    {
        auto delta = makeDelta(makePool(1000, 1000, 1000),
                               makePool(1010, 991, 1000));
        REQUIRE(invariant.checkOnOperationApply(swap, res, delta).empty());
    }

    SECTION("swap that lowers the product")
    {
        auto delta = makeDelta(makePool(1000, 1000, 1000),
                               makePool(1010, 990, 1000));
        REQUIRE(!invariant.checkOnOperationApply(swap, res, delta).empty());
    }

    SECTION("proportional withdrawal")
    {
        auto op = PoolOperation::makeWithdraw(10, 1, 1);
        auto delta =
            makeDelta(makePool(1000, 2000, 100), makePool(900, 1800, 90));
        REQUIRE(invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("withdrawal paying more than its share")
    {
        auto op = PoolOperation::makeWithdraw(10, 1, 1);
        auto delta =
            makeDelta(makePool(1000, 2000, 100), makePool(899, 1800, 90));
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("deposit taking less than its share")
    {
        auto op = PoolOperation::makeDeposit(10, 100, 200);
        auto delta =
            makeDelta(makePool(1000, 2000, 100), makePool(1100, 2199, 110));
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("bootstrap and last withdrawal")
    {
        auto op = PoolOperation::makeDeposit(10, 100, 200);
        REQUIRE(invariant
                    .checkOnOperationApply(
                        op, res,
                        makeDelta(makePool(0, 0, 0), makePool(100, 200, 10)))
                    .empty());
        REQUIRE(invariant
                    .checkOnOperationApply(
                        op, res,
                        makeDelta(makePool(100, 200, 10), makePool(0, 0, 0)))
                    .empty());
    }
}

TEST_CASE("pool shares are coupled", "[invariant][coupled]")
{
    PoolSharesAreCoupled invariant;
    auto op = PoolOperation::makeWithdraw(10, 1, 1);
    PoolOperationResult res;
    auto previous = makePool(100, 100, 10);

    REQUIRE(invariant
                .checkOnOperationApply(
                    op, res, makeDelta(previous, makePool(0, 0, 0)))
                .empty());
    REQUIRE(!invariant
                 .checkOnOperationApply(
                     op, res, makeDelta(previous, makePool(0, 0, 1)))
                 .empty());
    REQUIRE(!invariant
                 .checkOnOperationApply(
                     op, res, makeDelta(previous, makePool(1, 1, 0)))
                 .empty());
}

TEST_CASE("pool reserves match effects", "[invariant][effects]")
{
    PoolReservesMatchEffects invariant;
    auto previous = makePool(1000, 2000, 100);

    auto op = PoolOperation::makeDeposit(10, 100, 200);
    auto res = quoteOperation(previous, op);
    REQUIRE(res.code == POOL_SUCCESS);

    SECTION("matching")
    {
        auto delta = makeDelta(previous, makePool(1100, 2200, 110));
        REQUIRE(invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("reserve X differs")
    {
        auto delta = makeDelta(previous, makePool(1101, 2200, 110));
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("reserve Y differs")
    {
        auto delta = makeDelta(previous, makePool(1100, 2199, 110));
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("supply differs")
    {
        auto delta = makeDelta(previous, makePool(1100, 2200, 111));
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("parameters changed")
    {
        auto current = makePool(1100, 2200, 110);
        current.feeBps = 31;
        auto delta = makeDelta(previous, current);
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("swap")
    {
        auto swap = PoolOperation::makeSwap(POOL_ASSET_Y, 200, 0);
        auto swapRes = quoteOperation(previous, swap);
        REQUIRE(swapRes.code == POOL_SUCCESS);
        auto current = previous;
        current.reserveY += swapRes.swap.deposit;
        current.reserveX -= swapRes.swap.withdraw;
        REQUIRE(invariant
                    .checkOnOperationApply(swap, swapRes,
                                           makeDelta(previous, current))
                    .empty());
    }
}

TEST_CASE("pool balances are conserved", "[invariant][conservation]")
{
    PoolBalancesAreConserved invariant;
    auto op = PoolOperation::makeDeposit(10, 100, 200);
    PoolOperationResult res;

    auto delta =
        makeDelta(makePool(1000, 2000, 100), makePool(1100, 2200, 110));
    auto& account = delta.accounts["alice"];
    account.previous.balanceX = 500;
    account.previous.balanceY = 500;
    account.current.balanceX = 400;
    account.current.balanceY = 300;
    account.current.poolShares = 10;

    SECTION("conserved")
    {
        REQUIRE(invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("X created")
    {
        account.current.balanceX = 401;
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("Y destroyed")
    {
        account.current.balanceY = 299;
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }

    SECTION("shares not credited")
    {
        account.current.poolShares = 9;
        REQUIRE(!invariant.checkOnOperationApply(op, res, delta).empty());
    }
}

TEST_CASE("invariants hold over applied operations", "[invariant][pool]")
{
    TestPool pool(30);
    pool.createAccount("alice", 1000000, 1000000);
    pool.createAccount("bob", 1000000, 1000000);

    pool.deposit("alice", 1000, 10000, 40000);
    pool.deposit("bob", 333, 10000, 40000);
    pool.swap("bob", POOL_ASSET_X, 777, 0);
    pool.swap("alice", POOL_ASSET_Y, 5000, 0);
    pool.withdraw("bob", 333, 1, 1);
    pool.withdraw("alice", 1000, 1, 1);

    REQUIRE(pool.getInvariantManager().getFailureCount() == 0);
    REQUIRE(pool.getSnapshot() == makePool(0, 0, 0));
}
