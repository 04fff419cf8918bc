// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "util/Logging.h"

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <type_traits>

namespace cpamm
{

Config::Config()
{
    LOG_COLOR = false;
    INVARIANT_CHECKS = {".*"};

    POOL_FEE_BPS = 30;
    POOL_SHARE_DECIMALS = DEFAULT_SHARE_DECIMALS;
    POOL_LOCKED = false;
}

namespace
{

using ConfigItem = std::pair<std::string, std::shared_ptr<cpptoml::base>>;

bool
readBool(ConfigItem const& item)
{
    if (!item.second->as<bool>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<bool>()->get();
}

std::string
readString(ConfigItem const& item)
{
    if (!item.second->as<std::string>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<std::string>()->get();
}

template <typename T>
std::vector<T>
readArray(ConfigItem const& item)
{
    auto result = std::vector<T>{};
    if (!item.second->is_array())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("'{}' must be an array"), item.first));
    }
    for (auto v : item.second->as_array()->get())
    {
        if (!v->as<T>())
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("invalid element of '{}'"), item.first));
        }
        result.push_back(v->as<T>()->get());
    }
    return result;
}

template <typename T>
std::enable_if_t<std::is_unsigned_v<T>, T>
castInt(int64_t v, std::string const& name, T min, T max)
{
    // compare in the wide type before narrowing
    if (v < 0 || static_cast<uint64_t>(v) < min ||
        static_cast<uint64_t>(v) > max)
    {
        throw std::invalid_argument(fmt::format(FMT_STRING("bad '{}'"), name));
    }
    return static_cast<T>(v);
}

template <typename T>
T
readInt(ConfigItem const& item, T min = std::numeric_limits<T>::min(),
        T max = std::numeric_limits<T>::max())
{
    if (!item.second->as<int64_t>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return castInt<T>(item.second->as<int64_t>()->get(), item.first, min, max);
}

PoolAsset
readAsset(ConfigItem const& item)
{
    try
    {
        return poolAssetFromString(readString(item));
    }
    catch (std::invalid_argument&)
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("bad '{}', expected X or Y"), item.first));
    }
}
}

void
Config::load(std::string const& filename)
{
    if (filename != Config::STDIN_SPECIAL_NAME &&
        !std::filesystem::exists(filename))
    {
        std::string s;
        s = "No config file ";
        s += filename + " found";
        throw std::invalid_argument(s);
    }

    LOG_DEBUG(DEFAULT_LOG, "Loading config from: {}", filename);
    try
    {
        if (filename == Config::STDIN_SPECIAL_NAME)
        {
            load(std::cin);
        }
        else
        {
            std::ifstream ifs(filename);
            if (!ifs)
            {
                throw std::runtime_error(fmt::format(
                    FMT_STRING("Error opening file '{}'"), filename));
            }
            ifs.exceptions(std::ios::badbit);
            load(ifs);
        }
    }
    catch (std::exception const& ex)
    {
        std::string err("Failed to parse '");
        err += filename;
        err += "' :";
        err += ex.what();
        throw std::invalid_argument(err);
    }
}

void
Config::load(std::istream& in)
{
    std::shared_ptr<cpptoml::table> t;
    cpptoml::parser p(in);
    t = p.parse();
    processConfig(t);
}

void
Config::processPool(std::shared_ptr<cpptoml::base> pool)
{
    auto table = pool->as_table();
    if (!table)
    {
        throw std::invalid_argument("malformed POOL");
    }
    for (auto const& f : *table)
    {
        if (f.first == "FEE_BPS")
        {
            POOL_FEE_BPS = readInt<uint32_t>(f, 0, FEE_BPS_DENOMINATOR);
        }
        else if (f.first == "SHARE_DECIMALS")
        {
            // 10^19 is the largest power of ten that fits in 64 bits
            POOL_SHARE_DECIMALS = readInt<uint32_t>(f, 0, 19);
        }
        else if (f.first == "LOCKED")
        {
            POOL_LOCKED = readBool(f);
        }
        else
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("malformed POOL, unknown element '{}'"), f.first));
        }
    }
}

std::vector<AccountConfiguration>
Config::parseAccounts(std::shared_ptr<cpptoml::base> accounts)
{
    std::vector<AccountConfiguration> res;

    auto tarr = accounts->as_table_array();
    if (!tarr)
    {
        throw std::invalid_argument("malformed ACCOUNTS");
    }
    std::set<std::string> names;
    for (auto const& accRaw : *tarr)
    {
        auto account = accRaw->as_table();
        if (!account)
        {
            throw std::invalid_argument("malformed ACCOUNTS");
        }
        AccountConfiguration ac;
        for (auto const& f : *account)
        {
            if (f.first == "NAME")
            {
                ac.mName = readString(f);
            }
            else if (f.first == "BALANCE_X")
            {
                ac.mBalanceX = readInt<uint64_t>(f);
            }
            else if (f.first == "BALANCE_Y")
            {
                ac.mBalanceY = readInt<uint64_t>(f);
            }
            else
            {
                throw std::invalid_argument(fmt::format(
                    FMT_STRING(
                        "malformed ACCOUNTS entry, unknown element '{}'"),
                    f.first));
            }
        }
        if (ac.mName.empty())
        {
            throw std::invalid_argument(
                "malformed ACCOUNTS entry: missing 'NAME'");
        }
        if (!names.insert(ac.mName).second)
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("Malformed ACCOUNTS: duplicate '{}'"), ac.mName));
        }
        res.emplace_back(ac);
    }
    return res;
}

std::vector<OperationConfiguration>
Config::parseOperations(std::shared_ptr<cpptoml::base> operations)
{
    std::vector<OperationConfiguration> res;

    auto tarr = operations->as_table_array();
    if (!tarr)
    {
        throw std::invalid_argument("malformed OPERATIONS");
    }
    for (auto const& opRaw : *tarr)
    {
        auto operation = opRaw->as_table();
        if (!operation)
        {
            throw std::invalid_argument("malformed OPERATIONS");
        }

        std::string type;
        std::string source;
        std::map<std::string, ConfigItem> fields;
        for (auto const& f : *operation)
        {
            if (f.first == "TYPE")
            {
                type = readString(f);
            }
            else if (f.first == "SOURCE")
            {
                source = readString(f);
            }
            else
            {
                fields.emplace(f.first, f);
            }
        }
        if (source.empty())
        {
            throw std::invalid_argument(
                "malformed OPERATIONS entry: missing 'SOURCE'");
        }

        // fields each type accepts, absent ones are zero
        std::map<std::string, std::set<std::string>> const allowed = {
            {"deposit", {"SHARES", "MAX_X", "MAX_Y"}},
            {"withdraw", {"SHARES", "MIN_X", "MIN_Y"}},
            {"swap", {"INPUT", "AMOUNT", "MIN_OUTPUT"}}};
        auto typeIt = allowed.find(type);
        if (typeIt == allowed.end())
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("malformed OPERATIONS entry: bad 'TYPE' '{}'"),
                type));
        }
        for (auto const& kv : fields)
        {
            if (typeIt->second.count(kv.first) == 0)
            {
                throw std::invalid_argument(fmt::format(
                    FMT_STRING("malformed OPERATIONS entry, unknown element "
                               "'{}' for '{}'"),
                    kv.first, type));
            }
        }

        auto getInt = [&](std::string const& name) -> uint64_t {
            auto it = fields.find(name);
            return it == fields.end() ? 0 : readInt<uint64_t>(it->second);
        };

        OperationConfiguration oc;
        oc.mSource = source;
        if (type == "deposit")
        {
            oc.mOperation = PoolOperation::makeDeposit(
                getInt("SHARES"), getInt("MAX_X"), getInt("MAX_Y"));
        }
        else if (type == "withdraw")
        {
            oc.mOperation = PoolOperation::makeWithdraw(
                getInt("SHARES"), getInt("MIN_X"), getInt("MIN_Y"));
        }
        else
        {
            auto it = fields.find("INPUT");
            if (it == fields.end())
            {
                throw std::invalid_argument(
                    "malformed OPERATIONS entry: missing 'INPUT'");
            }
            oc.mOperation = PoolOperation::makeSwap(
                readAsset(it->second), getInt("AMOUNT"), getInt("MIN_OUTPUT"));
        }
        res.emplace_back(oc);
    }
    return res;
}

void
Config::processConfig(std::shared_ptr<cpptoml::table> t)
{
    try
    {
        if (!t)
        {
            throw std::runtime_error("Could not parse toml");
        }

        for (auto& item : *t)
        {
            LOG_DEBUG(DEFAULT_LOG, "Config item: {}", item.first);

            std::map<std::string, std::function<void()>> const confProcessor =
                {{"LOG_FILE_PATH", [&]() { LOG_FILE_PATH = readString(item); }},
                 {"LOG_COLOR", [&]() { LOG_COLOR = readBool(item); }},
                 {"INVARIANT_CHECKS",
                  [&]() {
                      INVARIANT_CHECKS = readArray<std::string>(item);
                  }},
                 {"POOL", [&]() { processPool(item.second); }},
                 {"ACCOUNTS",
                  [&]() { ACCOUNTS = parseAccounts(item.second); }},
                 {"OPERATIONS",
                  [&]() { OPERATIONS = parseOperations(item.second); }}};

            auto it = confProcessor.find(item.first);
            if (it != confProcessor.end())
            {
                it->second();
            }
            else
            {
                std::string err("Unknown configuration entry: '");
                err += item.first;
                err += "'";
                throw std::invalid_argument(err);
            }
        }
    }
    catch (cpptoml::parse_exception& ex)
    {
        throw std::invalid_argument(ex.what());
    }
}
}
