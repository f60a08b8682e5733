/*
 * Copyright (c) 2013 Juniper Networks, Inc. All rights reserved.
 */

#ifndef __LOGGING_H__
#define __LOGGING_H__

#include <string>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wunused-variable"
#endif

#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#define LOG(_Level, _Msg)                                        \
    do {                                                         \
        if (LoggingDisabled()) break;                            \
        log4cplus::Logger logger = log4cplus::Logger::getRoot(); \
        LOG4CPLUS_##_Level(logger, _Msg);                        \
    } while (0)

// Console logging at DEBUG, for tests and tools.
void LoggingInit();

// Rolling file (or "<stdout>") logging with optional syslog, for daemons.
// level is a log4cplus level name: TRACE, DEBUG, INFO, WARN, ERROR, FATAL.
void LoggingInit(const std::string &filename,
                 long maxFileSize,
                 int maxBackupIndex,
                 bool useSyslog,
                 const std::string &syslogFacility,
                 const std::string &ident,
                 const std::string &level);

//
// Disable logging - For testing purposes only
//
bool LoggingDisabled();
void SetLoggingDisabled(bool flag);

#endif /* __LOGGING_H__ */
