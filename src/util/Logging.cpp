// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"
#include "util/types.h"

#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cpamm
{

std::array<std::string const, 4> const Logging::kPartitionNames = {
#define LOG_PARTITION(name) #name,
#include "util/LogPartitions.def"
#undef LOG_PARTITION
};

LogLevel Logging::mGlobalLogLevel = LogLevel::LVL_INFO;
std::map<std::string, LogLevel> Logging::mPartitionLogLevels;
bool Logging::mInitialized = false;
bool Logging::mColor = false;
std::string Logging::mPattern;
std::string Logging::mFilename;
std::recursive_mutex Logging::mLogMutex;

namespace
{

std::string const kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%n %l%$] %v";

// indexed by LogLevel
std::array<std::pair<char const*, spdlog::level::level_enum>, 6> const
    kLevels = {{{"fatal", spdlog::level::critical},
                {"error", spdlog::level::err},
                {"warning", spdlog::level::warn},
                {"info", spdlog::level::info},
                {"debug", spdlog::level::debug},
                {"trace", spdlog::level::trace}}};

spdlog::level::level_enum
toSpdlogLevel(LogLevel level)
{
    return kLevels.at(static_cast<size_t>(level)).second;
}

spdlog::sink_ptr
makeConsoleSink(bool color)
{
    if (color)
    {
        return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_sink_mt>();
}

spdlog::sink_ptr
makeFileSink(std::string const& filename)
{
    std::ofstream out(filename, std::ios_base::out | std::ios_base::app);
    if (out.fail())
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("Could not open log file {}, check access rights"),
            filename));
    }
    out.close();
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        filename, /*truncate=*/false);
}
}

void
Logging::init()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (mInitialized)
    {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks{makeConsoleSink(mColor)};
    if (!mFilename.empty())
    {
        sinks.emplace_back(makeFileSink(mFilename));
    }

    auto makeLogger = [&](std::string const& name) {
        auto logger =
            std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        spdlog::register_logger(logger);
        return logger;
    };

    spdlog::set_default_logger(makeLogger("default"));
    for (auto const& partition : kPartitionNames)
    {
        makeLogger(partition);
    }

    if (mPattern.empty())
    {
        mPattern = kDefaultPattern;
    }
    spdlog::set_pattern(mPattern);
    spdlog::set_level(toSpdlogLevel(mGlobalLogLevel));
    for (auto const& pair : mPartitionLogLevels)
    {
        spdlog::get(pair.first)->set_level(toSpdlogLevel(pair.second));
    }
    spdlog::flush_on(spdlog::level::err);
    mInitialized = true;
}

void
Logging::deinit()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (!mInitialized)
    {
        return;
    }
#define LOG_PARTITION(name) Logging::name##LogPtr = nullptr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION
    spdlog::drop_all();
    mInitialized = false;
}

void
Logging::setFmt(std::string const& tag, bool timestamps)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    init();
    mPattern = timestamps ? std::string("%Y-%m-%dT%H:%M:%S.%e ") : "";
    if (!tag.empty())
    {
        mPattern += tag + " ";
    }
    mPattern += "[%^%n %l%$] %v";
    spdlog::set_pattern(mPattern);
}

void
Logging::setLoggingToFile(std::string const& filename)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mFilename = filename;
    deinit();
    try
    {
        init();
    }
    catch (std::runtime_error const&)
    {
        // fall back on console-only logging
        mFilename.clear();
        deinit();
        init();
        throw;
    }
}

void
Logging::setLoggingColor(bool color)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mColor = color;
    deinit();
    init();
}

void
Logging::setLogLevel(LogLevel level, char const* partition)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    init();
    if (partition)
    {
        mPartitionLogLevels[partition] = level;
        spdlog::get(partition)->set_level(toSpdlogLevel(level));
    }
    else
    {
        mGlobalLogLevel = level;
        mPartitionLogLevels.clear();
        spdlog::set_level(toSpdlogLevel(level));
    }
}

LogLevel
Logging::getLLfromString(std::string const& levelName)
{
    for (size_t i = 0; i < kLevels.size(); ++i)
    {
        if (iequals(levelName, kLevels[i].first))
        {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::LVL_INFO;
}

#define LOG_PARTITION(name) \
    LogPtr Logging::name##LogPtr = nullptr; \
    LogPtr Logging::get##name##LogPtr() \
    { \
        std::lock_guard<std::recursive_mutex> guard(mLogMutex); \
        if (!name##LogPtr) \
        { \
            name##LogPtr = spdlog::get(#name); \
        } \
        return name##LogPtr; \
    }
#include "util/LogPartitions.def"
#undef LOG_PARTITION
}
