#pragma once
// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "pool/PoolTypes.h"

#include <cpptoml.h>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace cpamm
{

struct AccountConfiguration
{
    std::string mName;
    uint64_t mBalanceX{0};
    uint64_t mBalanceY{0};
};

// one operation of the scenario the "run" command replays
struct OperationConfiguration
{
    std::string mSource;
    PoolOperation mOperation;
};

class Config
{
    void processConfig(std::shared_ptr<cpptoml::table> t);
    void processPool(std::shared_ptr<cpptoml::base> pool);
    std::vector<AccountConfiguration>
    parseAccounts(std::shared_ptr<cpptoml::base> accounts);
    std::vector<OperationConfiguration>
    parseOperations(std::shared_ptr<cpptoml::base> operations);

  public:
    static constexpr char const* STDIN_SPECIAL_NAME = "stdin";

    // log to this file in addition to the console, "" to disable
    std::string LOG_FILE_PATH;
    bool LOG_COLOR;

    // regular expressions selecting the invariants to check, see
    // InvariantManager::enableInvariant
    std::vector<std::string> INVARIANT_CHECKS;

    // [POOL]
    uint32_t POOL_FEE_BPS;
    uint32_t POOL_SHARE_DECIMALS;
    bool POOL_LOCKED;

    // [[ACCOUNTS]]
    std::vector<AccountConfiguration> ACCOUNTS;

    // [[OPERATIONS]]
    std::vector<OperationConfiguration> OPERATIONS;

    Config();

    void load(std::string const& filename);
    void load(std::istream& in);
};
}
