#include "mwscl/log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace
{

std::string getEnvSafe(char const* env)
{
    auto value = std::getenv(env);
    if (value)
        return std::string(value);
    return std::string();
}

void applyLogLevel(spdlog::logger& logger, std::string logLevel)
{
    for (auto& ch : logLevel)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (logLevel == "error" || logLevel == "err")
        logger.set_level(spdlog::level::err);
    else if (logLevel == "warning" || logLevel == "warn")
        logger.set_level(spdlog::level::warn);
    else if (logLevel == "info")
        logger.set_level(spdlog::level::info);
    else if (logLevel == "debug" || logLevel == "dbg")
        logger.set_level(spdlog::level::debug);
    else if (logLevel == "trace")
        logger.set_level(spdlog::level::trace);
}

}

spdlog::logger& mwscl::log()
{
    static std::shared_ptr<spdlog::logger> mwsLogger;
    static std::shared_mutex loggerAccess;

    {
        // Check if the logger is already initialized - read-only lock
        std::shared_lock<std::shared_mutex> readLock(loggerAccess);
        if (mwsLogger)
            return *mwsLogger;
    }

    std::lock_guard<std::shared_mutex> writeLock(loggerAccess);

    // Check again, another thread might have initialized now
    if (mwsLogger)
        return *mwsLogger;

    std::string logFile = getEnvSafe("MWS_LOG_FILE");
    std::string logFileMaxSize = getEnvSafe("MWS_LOG_FILE_MAXSIZE");
    std::size_t logFileMaxSizeInt = 64ull*1024*1024; // 64MB

    // File logger on demand, otherwise console logger
    if (!logFile.empty()) {
        std::cerr << "Logging MWS query events to '" << logFile << "'!" << std::endl;
        if (!logFileMaxSize.empty()) {
            try {
                logFileMaxSizeInt = std::stoull(logFileMaxSize);
            }
            catch (std::exception& e) {
                std::cerr << "Could not parse value of MWS_LOG_FILE_MAXSIZE." << std::endl;
            }
        }
        mwsLogger = spdlog::rotating_logger_mt("mws-query", logFile, logFileMaxSizeInt, 2);
    }
    else
        mwsLogger = spdlog::stderr_color_mt("mws-query");

    applyLogLevel(*mwsLogger, getEnvSafe("MWS_LOG_LEVEL"));

    return *mwsLogger;
}
