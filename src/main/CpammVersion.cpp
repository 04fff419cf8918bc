// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/CpammVersion.h"

// set by the build system from the project version
#ifndef CPAMM_VERSION_STRING
#define CPAMM_VERSION_STRING "unknown"
#endif

namespace cpamm
{
const std::string CPAMM_VERSION = "cpamm " CPAMM_VERSION_STRING;
}
