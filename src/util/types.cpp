// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"
#include "util/numeric.h"

#include <cctype>

namespace cpamm
{

bool
iequals(std::string const& a, std::string const& b)
{
    size_t sz = a.size();
    if (b.size() != sz)
        return false;
    for (size_t i = 0; i < sz; ++i)
        if (tolower(a[i]) != tolower(b[i]))
            return false;
    return true;
}

bool
addBalance(uint64_t& balance, uint64_t amount)
{
    uint64_t res;
    if (!checkedAdd(res, balance, amount))
    {
        return false;
    }
    balance = res;
    return true;
}

bool
subtractBalance(uint64_t& balance, uint64_t amount)
{
    uint64_t res;
    if (!checkedSubtract(res, balance, amount))
    {
        return false;
    }
    balance = res;
    return true;
}
}
