#pragma once

// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Always include this file instead of catch2/catch.hpp in order to get
// access to Catch2.
// This is necessary for the StringMaker specializations to work properly
// without violating the one definition rule.
// Define any StringMaker specializations here for pretty printing the custom
// types.

#include <catch2/catch.hpp>

#include "pool/PoolTypes.h"

namespace cpamm
{
struct PoolAccountEntry;
}

namespace Catch
{
template <> struct StringMaker<cpamm::PoolSnapshot>
{
    static std::string convert(cpamm::PoolSnapshot const& snapshot);
};

template <> struct StringMaker<cpamm::PoolEffect>
{
    static std::string convert(cpamm::PoolEffect const& effect);
};

template <> struct StringMaker<cpamm::PoolResultCode>
{
    static std::string convert(cpamm::PoolResultCode const& code);
};

template <> struct StringMaker<cpamm::PoolAccountEntry>
{
    static std::string convert(cpamm::PoolAccountEntry const& entry);
};
} // namespace Catch
