// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#pragma once

namespace cpamm
{
[[noreturn]] void printAssertFailureAndThrow(char const* expression,
                                             char const* file, int line);

// Checks an internal precondition in every build type and throws
// std::runtime_error naming the expression when it does not hold.
#define releaseAssertOrThrow(e) \
    (static_cast<bool>(e) \
         ? void(0) \
         : cpamm::printAssertFailureAndThrow(#e, __FILE__, __LINE__))
}
