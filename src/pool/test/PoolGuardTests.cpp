// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolGuard.h"
#include "test/Catch2.h"

#include <stdexcept>

using namespace cpamm;

TEST_CASE("pool state validity", "[guard]")
{
    PoolSnapshot snapshot;
    snapshot.feeBps = 30;
    REQUIRE(PoolGuard::isValidPoolState(snapshot));

    SECTION("funded pool")
    {
        snapshot.reserveX = 10;
        snapshot.reserveY = 10;
        snapshot.totalPoolShares = 10;
        REQUIRE(PoolGuard::isValidPoolState(snapshot));
        REQUIRE_NOTHROW(PoolGuard::checkPoolState(snapshot));
    }

    SECTION("one reserve drained")
    {
        snapshot.reserveX = 10;
        snapshot.totalPoolShares = 10;
        REQUIRE(PoolGuard::isValidPoolState(snapshot));
    }

    SECTION("shares without reserves")
    {
        snapshot.totalPoolShares = 1;
        REQUIRE(!PoolGuard::isValidPoolState(snapshot));
        REQUIRE_THROWS_AS(PoolGuard::checkPoolState(snapshot),
                          std::runtime_error);
    }

    SECTION("reserves without shares")
    {
        snapshot.reserveY = 1;
        REQUIRE(!PoolGuard::isValidPoolState(snapshot));
    }

    SECTION("fee")
    {
        snapshot.feeBps = 10000;
        REQUIRE(PoolGuard::isValidPoolState(snapshot));
        snapshot.feeBps = 10001;
        REQUIRE(!PoolGuard::isValidPoolState(snapshot));
    }
}

TEST_CASE("pool lock", "[guard]")
{
    PoolSnapshot snapshot;
    REQUIRE(PoolGuard::checkNotLocked(snapshot) == POOL_SUCCESS);
    snapshot.locked = true;
    REQUIRE(PoolGuard::checkNotLocked(snapshot) == POOL_LOCKED);
}

TEST_CASE("request amounts", "[guard]")
{
    REQUIRE(PoolGuard::checkRequest(DepositRequest{0, 10, 10}) ==
            POOL_INVALID_AMOUNT);
    REQUIRE(PoolGuard::checkRequest(DepositRequest{1, 0, 0}) ==
            POOL_SUCCESS);

    REQUIRE(PoolGuard::checkRequest(WithdrawRequest{0, 1, 1}) ==
            POOL_INVALID_AMOUNT);
    REQUIRE(PoolGuard::checkRequest(WithdrawRequest{1, 0, 0}) ==
            POOL_INVALID_AMOUNT);
    REQUIRE(PoolGuard::checkRequest(WithdrawRequest{1, 0, 1}) ==
            POOL_SUCCESS);
    REQUIRE(PoolGuard::checkRequest(WithdrawRequest{1, 1, 0}) ==
            POOL_SUCCESS);

    REQUIRE(PoolGuard::checkRequest(SwapRequest{POOL_ASSET_Y, 0, 0}) ==
            POOL_INVALID_AMOUNT);
    REQUIRE(PoolGuard::checkRequest(SwapRequest{POOL_ASSET_Y, 1, 0}) ==
            POOL_SUCCESS);
}

TEST_CASE("request bounds", "[guard]")
{
    SECTION("deposit")
    {
        DepositRequest request{10, 100, 200};
        REQUIRE(PoolGuard::checkBounds(request, CurveResult{100, 200}) ==
                POOL_SUCCESS);
        REQUIRE(PoolGuard::checkBounds(request, CurveResult{101, 200}) ==
                POOL_SLIPPAGE_EXCEEDED);
        REQUIRE(PoolGuard::checkBounds(request, CurveResult{100, 201}) ==
                POOL_SLIPPAGE_EXCEEDED);
        REQUIRE(PoolGuard::checkBounds(request, CurveResult{0, 200}) ==
                POOL_INVALID_AMOUNT);
        // slippage is reported before a zero leg
        REQUIRE(PoolGuard::checkBounds(request, CurveResult{0, 201}) ==
                POOL_SLIPPAGE_EXCEEDED);
    }

    SECTION("withdraw")
    {
        WithdrawRequest request{10, 5, 0};
        REQUIRE(PoolGuard::checkBounds(request, CurveResult{5, 1}) ==
                POOL_SUCCESS);
        REQUIRE(PoolGuard::checkBounds(request, CurveResult{4, 100}) ==
                POOL_SLIPPAGE_EXCEEDED);
        REQUIRE(PoolGuard::checkBounds(request, CurveResult{5, 0}) ==
                POOL_INVALID_AMOUNT);
    }

    SECTION("swap")
    {
        SwapRequest request{POOL_ASSET_X, 100, 50};
        REQUIRE(PoolGuard::checkBounds(request, SwapResult{100, 50}) ==
                POOL_SUCCESS);
        REQUIRE(PoolGuard::checkBounds(request, SwapResult{100, 49}) ==
                POOL_SLIPPAGE_EXCEEDED);

        SwapRequest noFloor{POOL_ASSET_X, 100, 0};
        REQUIRE(PoolGuard::checkBounds(noFloor, SwapResult{100, 0}) ==
                POOL_INVALID_AMOUNT);
    }
}
