// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "invariant/InvariantDoesNotHold.h"
#include "main/CommandLine.h"
#include "util/Logging.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <system_error>

namespace cpamm
{
static void
printException(char const* kind, char const* what)
{
    std::fprintf(stderr, "current exception: %s(\"%s\")\n", kind, what);
}

static void
printCurrentException()
{
    std::exception_ptr eptr = std::current_exception();
    if (!eptr)
    {
        return;
    }
    try
    {
        std::rethrow_exception(eptr);
    }
    catch (InvariantDoesNotHold const& e)
    {
        printException("InvariantDoesNotHold", e.what());
    }
    catch (std::filesystem::filesystem_error const& e)
    {
        std::fprintf(stderr,
                     "current exception: std::filesystem::filesystem_error("
                     "%d, \"%s\", \"%s\")\n",
                     e.code().value(), e.what(), e.path1().string().c_str());
    }
    catch (std::system_error const& e)
    {
        std::fprintf(stderr,
                     "current exception: std::system_error(%d, \"%s\")\n",
                     e.code().value(), e.what());
    }
    catch (std::invalid_argument const& e)
    {
        printException("std::invalid_argument", e.what());
    }
    catch (std::runtime_error const& e)
    {
        printException("std::runtime_error", e.what());
    }
    catch (std::exception const& e)
    {
        printException("std::exception", e.what());
    }
    catch (...)
    {
        std::fprintf(stderr, "current exception: unknown\n");
    }
    std::fflush(stderr);
}

static void
printExceptionAndAbort()
{
    printCurrentException();
    std::abort();
}

static void
outOfMemory()
{
    std::fprintf(stderr, "Unable to allocate memory\n");
    std::fflush(stderr);
    printExceptionAndAbort();
}
}

int
main(int argc, char* const* argv)
{
    using namespace cpamm;

    std::set_new_handler(outOfMemory);
    // an exception escaping a noexcept path still gets printed
    std::set_terminate(printExceptionAndAbort);
    Logging::init();

    return handleCommandLine(argc, argv);
}
