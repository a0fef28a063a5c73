#pragma once

#include "mcplink/logging/logger_registry.h"

// Each source file names its logger before including this header:
//
//   #define MCPLINK_LOG_COMPONENT "transport.stdio"
//   #include "mcplink/logging/log_macros.h"
#ifndef MCPLINK_LOG_COMPONENT
#define MCPLINK_LOG_COMPONENT "default"
#endif

#ifdef MCPLINK_LOG_DISABLE
#define MCPLINK_LOG(level, ...) ((void)0)
#else
#define MCPLINK_LOG(level, ...)                                           \
  do {                                                                    \
    auto mcplink_logger_ =                                                \
        ::mcplink::logging::LoggerRegistry::instance().getOrCreateLogger( \
            MCPLINK_LOG_COMPONENT);                                       \
    if (mcplink_logger_->shouldLog(::mcplink::logging::LogLevel::level)) { \
      mcplink_logger_->log(::mcplink::logging::LogLevel::level, __FILE__, \
                           __LINE__, __FUNCTION__, __VA_ARGS__);          \
    }                                                                     \
  } while (0)
#endif

#define MCPLINK_LOG_DEBUG(...) MCPLINK_LOG(Debug, __VA_ARGS__)
#define MCPLINK_LOG_INFO(...) MCPLINK_LOG(Info, __VA_ARGS__)
#define MCPLINK_LOG_WARNING(...) MCPLINK_LOG(Warning, __VA_ARGS__)
#define MCPLINK_LOG_ERROR(...) MCPLINK_LOG(Error, __VA_ARGS__)
