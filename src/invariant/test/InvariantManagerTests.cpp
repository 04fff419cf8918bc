// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/Invariant.h"
#include "invariant/InvariantDoesNotHold.h"
#include "invariant/InvariantManager.h"
#include "ledger/PoolLedgerTxn.h"
#include "test/Catch2.h"

#include <fmt/format.h>

#include <algorithm>

using namespace cpamm;

namespace InvariantTests
{

class TestInvariant : public Invariant
{
  public:
    TestInvariant(int id, bool shouldFail, bool strict = true)
        : Invariant(strict), mInvariantID(id), mShouldFail(shouldFail)
    {
    }

    // if id < 0, generate prefix that will match any invariant
    static std::string
    toString(int id, bool fail)
    {
        if (id < 0)
        {
            return fmt::format("TestInvariant{}", fail ? "Fail" : "Succeed");
        }
        else
        {
            return fmt::format("TestInvariant{}{}", fail ? "Fail" : "Succeed",
                               id);
        }
    }

    virtual std::string
    getName() const override
    {
        return toString(mInvariantID, mShouldFail);
    }

    virtual std::string
    checkOnOperationApply(PoolOperation const& operation,
                          PoolOperationResult const& result,
                          PoolLedgerTxnDelta const& ltxDelta) override
    {
        return mShouldFail ? "fail" : "";
    }

  private:
    int mInvariantID;
    bool mShouldFail;
};
}

using namespace InvariantTests;

TEST_CASE("no duplicate register", "[invariant]")
{
    auto invariantManager = InvariantManager::create();

    invariantManager->registerInvariant<TestInvariant>(0, true);
    REQUIRE_THROWS_AS(
        invariantManager->registerInvariant<TestInvariant>(0, true),
        std::runtime_error);
}

TEST_CASE("no duplicate enable", "[invariant]")
{
    auto invariantManager = InvariantManager::create();

    invariantManager->registerInvariant<TestInvariant>(0, true);
    invariantManager->enableInvariant(TestInvariant::toString(0, true));
    REQUIRE_THROWS_AS(
        invariantManager->enableInvariant(TestInvariant::toString(0, true)),
        std::runtime_error);
}

TEST_CASE("only enable registered invariants", "[invariant]")
{
    auto invariantManager = InvariantManager::create();

    SECTION("no invariant registered")
    {
        REQUIRE_THROWS_AS(invariantManager->enableInvariant(".*"),
                          std::runtime_error);
    }

    SECTION("wrong name")
    {
        invariantManager->registerInvariant<TestInvariant>(0, true);
        invariantManager->enableInvariant(TestInvariant::toString(0, true));
        REQUIRE_THROWS_AS(invariantManager->enableInvariant("WrongName"),
                          std::runtime_error);
    }

    SECTION("bad pattern")
    {
        invariantManager->registerInvariant<TestInvariant>(0, true);
        REQUIRE_THROWS_AS(invariantManager->enableInvariant(""),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(invariantManager->enableInvariant("("),
                          std::invalid_argument);
    }
}

TEST_CASE("enable registered invariants regex", "[invariant]")
{
    auto invariantManager = InvariantManager::create();

    const int nbInvariants = 3;
    for (int i = 0; i < nbInvariants; i++)
    {
        invariantManager->registerInvariant<TestInvariant>(i, true);
    }
    invariantManager->registerInvariant<TestInvariant>(nbInvariants, false);

    invariantManager->enableInvariant(TestInvariant::toString(-1, true) +
                                      ".*");
    auto e = invariantManager->getEnabledInvariants();
    std::sort(e.begin(), e.end());

    REQUIRE(e.size() == nbInvariants);
    for (int i = 0; i < nbInvariants; i++)
    {
        REQUIRE(e[i] == TestInvariant::toString(i, true));
    }

    SECTION("case insensitive")
    {
        invariantManager->enableInvariant("testinvariantsucceed.*");
        REQUIRE(invariantManager->getEnabledInvariants().size() ==
                nbInvariants + 1);
    }
}

TEST_CASE("pool invariants are registered", "[invariant]")
{
    auto invariantManager = InvariantManager::create();
    registerPoolInvariants(*invariantManager);
    invariantManager->enableInvariant(".*");

    auto e = invariantManager->getEnabledInvariants();
    std::sort(e.begin(), e.end());
    REQUIRE(e == std::vector<std::string>{"ConstantProductInvariant",
                                          "PoolBalancesAreConserved",
                                          "PoolReservesMatchEffects",
                                          "PoolSharesAreCoupled"});
}

TEST_CASE("onOperationApply fail succeed", "[invariant]")
{
    auto invariantManager = InvariantManager::create();

    auto op = PoolOperation::makeSwap(POOL_ASSET_X, 1, 0);
    PoolOperationResult res;
    PoolLedgerTxnDelta delta;

    SECTION("Fail")
    {
        invariantManager->registerInvariant<TestInvariant>(0, true);
        invariantManager->enableInvariant(TestInvariant::toString(0, true));

        REQUIRE_THROWS_AS(
            invariantManager->checkOnOperationApply(op, res, delta),
            InvariantDoesNotHold);
        REQUIRE(invariantManager->getFailureCount() == 1);
        REQUIRE(!invariantManager->getLastFailure(
                                      TestInvariant::toString(0, true))
                     .empty());
    }

    SECTION("Succeed")
    {
        invariantManager->registerInvariant<TestInvariant>(0, false);
        invariantManager->enableInvariant(TestInvariant::toString(0, false));

        REQUIRE_NOTHROW(
            invariantManager->checkOnOperationApply(op, res, delta));
        REQUIRE(invariantManager->getFailureCount() == 0);
    }

    SECTION("Fail without throwing when not strict")
    {
        invariantManager->registerInvariant<TestInvariant>(0, true, false);
        invariantManager->enableInvariant(TestInvariant::toString(0, true));

        REQUIRE_NOTHROW(
            invariantManager->checkOnOperationApply(op, res, delta));
        REQUIRE_NOTHROW(
            invariantManager->checkOnOperationApply(op, res, delta));
        REQUIRE(invariantManager->getFailureCount() == 2);
    }

    SECTION("Disabled invariants are not checked")
    {
        invariantManager->registerInvariant<TestInvariant>(0, true);
        invariantManager->registerInvariant<TestInvariant>(1, false);
        invariantManager->enableInvariant(TestInvariant::toString(1, false));

        REQUIRE_NOTHROW(
            invariantManager->checkOnOperationApply(op, res, delta));
    }
}
