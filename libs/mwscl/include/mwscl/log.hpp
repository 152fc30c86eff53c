#pragma once

#include "spdlog/spdlog.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace mwscl
{

/**
 * Obtain global logger, which is initialized from
 * the following environment variables:
 *  - MWS_LOG_LEVEL
 *  - MWS_LOG_FILE
 *  - MWS_LOG_FILE_MAXSIZE
 */
spdlog::logger& log();

/**
 * Log a runtime error and return the throwable object.
 * Additional arguments are forwarded to the error constructor
 * after the message.
 * @param what Runtime error message.
 * @return error_t to throw.
 */
template<typename error_t = std::runtime_error, typename... Args>
error_t logRuntimeError(std::string const& what, Args&&... args) {
    log().error(what);
    return error_t(what, std::forward<Args>(args)...);
}

}
