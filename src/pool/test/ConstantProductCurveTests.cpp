// Copyright 2021 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/ConstantProductCurve.h"
#include "test/Catch2.h"
#include "util/numeric128.h"

#include <limits>
#include <stdexcept>

using namespace cpamm;

TEST_CASE("pool deposit amounts", "[curve][deposit]")
{
    uint64_t amountX = 0;
    uint64_t amountY = 0;

    SECTION("exact")
    {
        REQUIRE(getPoolDepositAmounts(amountX, amountY, 1000, 2000, 1000, 10));
        REQUIRE(amountX == 10);
        REQUIRE(amountY == 20);
    }

    SECTION("rounds up")
    {
        REQUIRE(getPoolDepositAmounts(amountX, amountY, 1001, 2001, 1000, 1));
        REQUIRE(amountX == 2);
        REQUIRE(amountY == 3);
    }

    SECTION("overflow leaves the outputs untouched")
    {
        uint64_t const max = std::numeric_limits<uint64_t>::max();
        amountX = 7;
        amountY = 8;
        REQUIRE(!getPoolDepositAmounts(amountX, amountY, max, 1, 1, 2));
        REQUIRE(amountX == 7);
        REQUIRE(amountY == 8);
    }

    SECTION("empty supply")
    {
        REQUIRE_THROWS_AS(
            getPoolDepositAmounts(amountX, amountY, 1000, 1000, 0, 1),
            std::runtime_error);
    }
}

TEST_CASE("pool withdrawal amount", "[curve][withdraw]")
{
    REQUIRE(getPoolWithdrawalAmount(1, 1000, 1001) == 1);
    REQUIRE(getPoolWithdrawalAmount(999, 1000, 1001) == 999);
    REQUIRE(getPoolWithdrawalAmount(1000, 1000, 1001) == 1001);
    REQUIRE(getPoolWithdrawalAmount(1, 1000, 999) == 0);

    uint64_t const max = std::numeric_limits<uint64_t>::max();
    REQUIRE(getPoolWithdrawalAmount(max, max, max) == max);
    REQUIRE(getPoolWithdrawalAmount(max - 1, max, max) == max - 1);

    REQUIRE_THROWS_AS(getPoolWithdrawalAmount(1001, 1000, 1),
                      std::runtime_error);
}

TEST_CASE("amount after fee", "[curve][fee]")
{
    REQUIRE(getAmountAfterFee(10000, 30) == 9970);
    REQUIRE(getAmountAfterFee(1, 30) == 0);
    REQUIRE(getAmountAfterFee(1000, 0) == 1000);
    REQUIRE(getAmountAfterFee(1000, 10000) == 0);

    uint64_t const max = std::numeric_limits<uint64_t>::max();
    REQUIRE(getAmountAfterFee(max, 0) == max);

    REQUIRE_THROWS_AS(getAmountAfterFee(1000, 10001), std::runtime_error);
}

TEST_CASE("exchange with pool", "[curve][swap]")
{
    uint64_t const max = std::numeric_limits<uint64_t>::max();
    uint64_t out = 0;

    SECTION("with fee")
    {
        REQUIRE(exchangeWithPool(1000000, 1000000, 10000, 30, out) ==
                POOL_SUCCESS);
        REQUIRE(out == 9871);
    }

    SECTION("without fee")
    {
        REQUIRE(exchangeWithPool(1000, 1000, 1000, 0, out) == POOL_SUCCESS);
        REQUIRE(out == 500);
    }

    SECTION("huge input never drains the pool")
    {
        REQUIRE(exchangeWithPool(1, 1000, 1000000000000000000ull, 0, out) ==
                POOL_SUCCESS);
        REQUIRE(out == 999);
    }

    SECTION("failures leave the output untouched")
    {
        out = 42;
        REQUIRE(exchangeWithPool(0, 1000, 10, 30, out) ==
                POOL_UNDEFINED_PRICE);
        REQUIRE(exchangeWithPool(1000, 0, 10, 30, out) ==
                POOL_UNDEFINED_PRICE);
        REQUIRE(exchangeWithPool(max, 1000, 1, 0, out) ==
                POOL_ARITHMETIC_OVERFLOW);
        REQUIRE(exchangeWithPool(1000, 1000, 1, 30, out) ==
                POOL_INVALID_AMOUNT);
        REQUIRE(exchangeWithPool(1000, 1000, 1000, 10000, out) ==
                POOL_INVALID_AMOUNT);
        REQUIRE(out == 42);
    }

    SECTION("product does not decrease")
    {
        auto reserveIn =
            GENERATE(take(20, random(uint64_t(1), uint64_t(1e12))));
        auto reserveOut =
            GENERATE(take(5, random(uint64_t(1), uint64_t(1e12))));
        auto amountIn = GENERATE(take(5, random(uint64_t(1), uint64_t(1e9))));

        auto code = exchangeWithPool(reserveIn, reserveOut, amountIn, 30, out);
        if (code == POOL_SUCCESS)
        {
            REQUIRE(out < reserveOut);
            auto before = bigMultiplyUnsigned(reserveIn, reserveOut);
            auto after =
                bigMultiplyUnsigned(reserveIn + amountIn, reserveOut - out);
            REQUIRE(after >= before);
        }
        else
        {
            REQUIRE(code == POOL_INVALID_AMOUNT);
        }
    }
}

TEST_CASE("bootstrap share amount", "[curve][bootstrap]")
{
    REQUIRE(getBootstrapShareAmount(100, 400) == 200);
    REQUIRE(getBootstrapShareAmount(2, 3) == 2);
    REQUIRE(getBootstrapShareAmount(0, 400) == 0);
    REQUIRE(getBootstrapShareAmount(1ull << 40, 1ull << 20) == 1ull << 30);
}

TEST_CASE("spot price", "[curve][price]")
{
    PoolSnapshot snapshot;
    snapshot.reserveX = 1000;
    snapshot.reserveY = 2000;
    snapshot.totalPoolShares = 1000;
    snapshot.shareDecimals = 6;

    uint64_t price = 0;
    REQUIRE(getSpotPrice(snapshot, POOL_ASSET_X, price) == POOL_SUCCESS);
    REQUIRE(price == 2000000);
    REQUIRE(getSpotPrice(snapshot, POOL_ASSET_Y, price) == POOL_SUCCESS);
    REQUIRE(price == 500000);

    SECTION("no decimals")
    {
        snapshot.shareDecimals = 0;
        REQUIRE(getSpotPrice(snapshot, POOL_ASSET_Y, price) == POOL_SUCCESS);
        REQUIRE(price == 0);
    }

    SECTION("scale overflows")
    {
        snapshot.shareDecimals = 20;
        REQUIRE(getSpotPrice(snapshot, POOL_ASSET_X, price) ==
                POOL_ARITHMETIC_OVERFLOW);
    }

    SECTION("empty reserve")
    {
        snapshot.reserveY = 0;
        REQUIRE(getSpotPrice(snapshot, POOL_ASSET_X, price) ==
                POOL_UNDEFINED_PRICE);
        REQUIRE(getSpotPrice(snapshot, POOL_ASSET_Y, price) ==
                POOL_UNDEFINED_PRICE);
    }

    SECTION("inconsistent snapshot")
    {
        snapshot.totalPoolShares = 0;
        REQUIRE_THROWS_AS(getSpotPrice(snapshot, POOL_ASSET_X, price),
                          std::runtime_error);
        REQUIRE(price == 500000);
    }
}
