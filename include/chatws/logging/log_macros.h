#pragma once

#include "chatws/logging/logger_registry.h"

// Zero-configuration logging through the default logger
#define LOG(level, ...)                                                   \
  do {                                                                    \
    auto logger =                                                         \
        ::chatws::logging::LoggerRegistry::instance().getDefaultLogger(); \
    if (logger->shouldLog(::chatws::logging::LogLevel::level)) {          \
      logger->log(::chatws::logging::LogLevel::level, __FILE__, __LINE__, \
                  __FUNCTION__, __VA_ARGS__);                             \
    }                                                                     \
  } while (0)

#define LOG_DEBUG(...) LOG(Debug, __VA_ARGS__)
#define LOG_INFO(...) LOG(Info, __VA_ARGS__)
#define LOG_WARNING(...) LOG(Warning, __VA_ARGS__)
#define LOG_ERROR(...) LOG(Error, __VA_ARGS__)

// Per-component logging; define CHATWS_LOG_COMPONENT before including
#ifdef CHATWS_LOG_DISABLE
#define CHATWS_LOG(level, ...) ((void)0)
#else
#define CHATWS_LOG(level, ...)                                          \
  do {                                                                  \
    if (::chatws::logging::LoggerRegistry::instance().shouldLog(        \
            CHATWS_LOG_COMPONENT, ::chatws::logging::LogLevel::level)) { \
      ::chatws::logging::LoggerRegistry::instance()                     \
          .getOrCreateLogger(CHATWS_LOG_COMPONENT)                      \
          ->log(::chatws::logging::LogLevel::level, __FILE__, __LINE__, \
                __FUNCTION__, __VA_ARGS__);                             \
    }                                                                   \
  } while (0)
#endif

#ifndef CHATWS_LOG_COMPONENT
#define CHATWS_LOG_COMPONENT "chatws"
#endif
