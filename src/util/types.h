#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <string>

namespace cpamm
{

// case-insensitive comparison
bool iequals(std::string const& a, std::string const& b);

// balance helpers, return false (leaving balance untouched) rather than wrap
bool addBalance(uint64_t& balance, uint64_t amount);
bool subtractBalance(uint64_t& balance, uint64_t amount);
}
