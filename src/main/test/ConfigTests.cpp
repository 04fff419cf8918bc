// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "test/Catch2.h"

#include <sstream>
#include <stdexcept>

using namespace cpamm;

TEST_CASE("config defaults", "[config]")
{
    Config c;
    REQUIRE(c.LOG_FILE_PATH.empty());
    REQUIRE(!c.LOG_COLOR);
    REQUIRE(c.INVARIANT_CHECKS == std::vector<std::string>{".*"});
    REQUIRE(c.POOL_FEE_BPS == 30);
    REQUIRE(c.POOL_SHARE_DECIMALS == 6);
    REQUIRE(!c.POOL_LOCKED);
    REQUIRE(c.ACCOUNTS.empty());
    REQUIRE(c.OPERATIONS.empty());
}

TEST_CASE("load config", "[config]")
{
    std::string const configStr = R"(
LOG_FILE_PATH = "cpamm.log"
LOG_COLOR = true
INVARIANT_CHECKS = ["ConstantProduct.*", "PoolSharesAreCoupled"]

[POOL]
FEE_BPS = 25
SHARE_DECIMALS = 7
LOCKED = false

[[ACCOUNTS]]
NAME = "alice"
BALANCE_X = 10000
BALANCE_Y = 20000

[[ACCOUNTS]]
NAME = "bob"
BALANCE_Y = 500

[[OPERATIONS]]
SOURCE = "alice"
TYPE = "deposit"
SHARES = 100
MAX_X = 100
MAX_Y = 400

[[OPERATIONS]]
SOURCE = "bob"
TYPE = "swap"
INPUT = "Y"
AMOUNT = 40

[[OPERATIONS]]
SOURCE = "alice"
TYPE = "withdraw"
SHARES = 50
MIN_X = 1
)";

    Config c;
    std::stringstream ss(configStr);
    REQUIRE_NOTHROW(c.load(ss));

    REQUIRE(c.LOG_FILE_PATH == "cpamm.log");
    REQUIRE(c.LOG_COLOR);
    REQUIRE(c.INVARIANT_CHECKS.size() == 2);
    REQUIRE(c.INVARIANT_CHECKS[1] == "PoolSharesAreCoupled");
    REQUIRE(c.POOL_FEE_BPS == 25);
    REQUIRE(c.POOL_SHARE_DECIMALS == 7);
    REQUIRE(!c.POOL_LOCKED);

    REQUIRE(c.ACCOUNTS.size() == 2);
    REQUIRE(c.ACCOUNTS[0].mName == "alice");
    REQUIRE(c.ACCOUNTS[0].mBalanceX == 10000);
    REQUIRE(c.ACCOUNTS[0].mBalanceY == 20000);
    REQUIRE(c.ACCOUNTS[1].mName == "bob");
    REQUIRE(c.ACCOUNTS[1].mBalanceX == 0);
    REQUIRE(c.ACCOUNTS[1].mBalanceY == 500);

    REQUIRE(c.OPERATIONS.size() == 3);

    auto const& dep = c.OPERATIONS[0];
    REQUIRE(dep.mSource == "alice");
    REQUIRE(dep.mOperation.type() == POOL_DEPOSIT);
    REQUIRE(dep.mOperation.deposit().shareAmount == 100);
    REQUIRE(dep.mOperation.deposit().maxAmountX == 100);
    REQUIRE(dep.mOperation.deposit().maxAmountY == 400);

    auto const& sw = c.OPERATIONS[1];
    REQUIRE(sw.mSource == "bob");
    REQUIRE(sw.mOperation.type() == POOL_SWAP);
    REQUIRE(sw.mOperation.swap().inputSide == POOL_ASSET_Y);
    REQUIRE(sw.mOperation.swap().inputAmount == 40);
    REQUIRE(sw.mOperation.swap().minOutput == 0);

    auto const& wd = c.OPERATIONS[2];
    REQUIRE(wd.mOperation.type() == POOL_WITHDRAW);
    REQUIRE(wd.mOperation.withdraw().shareAmount == 50);
    REQUIRE(wd.mOperation.withdraw().minAmountX == 1);
    REQUIRE(wd.mOperation.withdraw().minAmountY == 0);
}

TEST_CASE("bad configs", "[config]")
{
    std::vector<std::string> const badConfigs = {
        // unknown entries
        "UNKNOWN = 1",
        "[POOL]\nFEE = 30",
        "[[ACCOUNTS]]\nNAME = \"alice\"\nBALANCE_Z = 1",
        // wrong types
        "LOG_COLOR = \"yes\"",
        "LOG_FILE_PATH = 1",
        "INVARIANT_CHECKS = \".*\"",
        "INVARIANT_CHECKS = [1, 2]",
        "POOL = 1",
        "[POOL]\nLOCKED = 1",
        // out of range
        "[POOL]\nFEE_BPS = 10001",
        "[POOL]\nFEE_BPS = -1",
        "[POOL]\nFEE_BPS = 4294967326",
        "[POOL]\nSHARE_DECIMALS = 4294967302",
        "[POOL]\nSHARE_DECIMALS = 20",
        "[[ACCOUNTS]]\nNAME = \"alice\"\nBALANCE_X = -5",
        // accounts
        "[[ACCOUNTS]]\nBALANCE_X = 1",
        "[[ACCOUNTS]]\nNAME = \"alice\"\n[[ACCOUNTS]]\nNAME = \"alice\"",
        // operations
        "[[OPERATIONS]]\nTYPE = \"swap\"\nINPUT = \"X\"\nAMOUNT = 1",
        "[[OPERATIONS]]\nSOURCE = \"a\"\nTYPE = \"trade\"",
        "[[OPERATIONS]]\nSOURCE = \"a\"\nSHARES = 1",
        "[[OPERATIONS]]\nSOURCE = \"a\"\nTYPE = \"swap\"\nAMOUNT = 1",
        "[[OPERATIONS]]\nSOURCE = \"a\"\nTYPE = \"swap\"\nINPUT = \"Z\"",
        "[[OPERATIONS]]\nSOURCE = \"a\"\nTYPE = \"deposit\"\nMIN_X = 1",
        "[[OPERATIONS]]\nSOURCE = \"a\"\nTYPE = \"withdraw\"\nMAX_X = 1"};

    for (auto const& badConfig : badConfigs)
    {
        INFO(badConfig);
        Config c;
        std::stringstream ss(badConfig);
        REQUIRE_THROWS_AS(c.load(ss), std::invalid_argument);
    }

    SECTION("not toml")
    {
        Config c;
        std::stringstream ss("[POOL\nFEE_BPS = = 3");
        REQUIRE_THROWS(c.load(ss));
    }
}

TEST_CASE("operation fields default to zero", "[config]")
{
    Config c;
    std::stringstream ss("[[OPERATIONS]]\nSOURCE = \"a\"\nTYPE = \"deposit\"");
    REQUIRE_NOTHROW(c.load(ss));
    REQUIRE(c.OPERATIONS.size() == 1);
    REQUIRE(c.OPERATIONS[0].mOperation.deposit().shareAmount == 0);
    REQUIRE(c.OPERATIONS[0].mOperation.deposit().maxAmountX == 0);
}

TEST_CASE("missing config file", "[config]")
{
    Config c;
    REQUIRE_THROWS_WITH(c.load("does-not-exist.cfg"),
                        "No config file does-not-exist.cfg found");
}
