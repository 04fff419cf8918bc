// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <stdexcept>

namespace cpamm
{
void
printAssertFailureAndThrow(char const* expression, char const* file, int line)
{
    LOG_ERROR(DEFAULT_LOG, "assertion '{}' failed at {}:{}", expression, file,
              line);
    throw std::runtime_error(
        fmt::format(FMT_STRING("assertion failed: {}"), expression));
}
}
