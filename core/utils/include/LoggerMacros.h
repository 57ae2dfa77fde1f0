/**
 * @file LoggerMacros.h
 * @brief Logging shorthands used across the transfer path
 *
 * The *_IF variants skip building the message when the level is disabled:
 *   LOG_DEBUG_COMP_IF("Streaming chunk at offset " + std::to_string(offset), "TransferEngine");
 */

#pragma once

#include "Logger.h"

namespace FileCourier {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::FileCourier::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::FileCourier::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::FileCourier::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::FileCourier::Logger::instance().error(msg, component)

} // namespace FileCourier
