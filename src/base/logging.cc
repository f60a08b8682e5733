/*
 * Copyright (c) 2013 Juniper Networks, Inc. All rights reserved.
 */

#include "base/logging.h"

#include <stdlib.h>
#include <sys/types.h>
#include <unistd.h>
#include <log4cplus/configurator.h>
#include <log4cplus/helpers/property.h>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>

using namespace log4cplus;

static bool disabled_;
static const char *loggingPattern = "%D{%Y-%m-%d %a %H:%M:%S:%Q %Z} "
                                    " %h [Thread %t, Pid %i]: %m%n";

bool LoggingDisabled() {
    return disabled_;
}

void SetLoggingDisabled(bool flag) {
    disabled_ = flag;
}

static void CheckEnvironmentAndUpdate() {
    if (getenv("LOG_DISABLE") != NULL) {
        SetLoggingDisabled(true);
    }
}

static void SetPatternLayout(helpers::Properties *props,
                             const std::string &appender) {
    std::string prefix = "log4cplus.appender." + appender;
    props->setProperty(prefix + ".layout",
                       LOG4CPLUS_TEXT("log4cplus::PatternLayout"));
    props->setProperty(prefix + ".layout.ConversionPattern", loggingPattern);
}

void LoggingInit() {
    helpers::Properties props;
    props.setProperty(LOG4CPLUS_TEXT("log4cplus.rootLogger"),
                      LOG4CPLUS_TEXT("DEBUG, STDOUT"));
    props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.STDOUT"),
                      LOG4CPLUS_TEXT("log4cplus::ConsoleAppender"));
    SetPatternLayout(&props, "STDOUT");
    PropertyConfigurator config(props);
    config.configure();
    CheckEnvironmentAndUpdate();
}

void LoggingInit(const std::string &filename, long maxFileSize,
                 int maxBackupIndex, bool useSyslog,
                 const std::string &syslogFacility, const std::string &ident,
                 const std::string &level) {
    helpers::Properties props;
    std::string appenders;

    if (filename == "<stdout>" || filename.length() == 0) {
        appenders = "STDOUT";
        props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.STDOUT"),
                          LOG4CPLUS_TEXT("log4cplus::ConsoleAppender"));
        SetPatternLayout(&props, "STDOUT");
    } else {
        appenders = "FILE";
        props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.FILE"),
                          LOG4CPLUS_TEXT("log4cplus::RollingFileAppender"));
        props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.FILE.File"),
                          filename);
        props.setProperty(
            LOG4CPLUS_TEXT("log4cplus.appender.FILE.MaxFileSize"),
            boost::lexical_cast<std::string>(maxFileSize));
        props.setProperty(
            LOG4CPLUS_TEXT("log4cplus.appender.FILE.MaxBackupIndex"),
            boost::lexical_cast<std::string>(maxBackupIndex));
        SetPatternLayout(&props, "FILE");
    }

    if (useSyslog) {
        appenders += ", SYSLOG";
        std::string syslogident = boost::str(
            boost::format("%1%[%2%]") % ident % getpid());
        props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.SYSLOG"),
                          LOG4CPLUS_TEXT("log4cplus::SysLogAppender"));
        props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.SYSLOG.facility"),
                          boost::starts_with(syslogFacility, "LOG_")
                        ? syslogFacility.substr(4)
                        : syslogFacility);
        props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.SYSLOG.ident"),
                          syslogident);
        SetPatternLayout(&props, "SYSLOG");
    }

    props.setProperty(LOG4CPLUS_TEXT("log4cplus.rootLogger"),
                      (level.empty() ? std::string("DEBUG") : level) + ", " +
                      appenders);
    PropertyConfigurator config(props);
    config.configure();

    CheckEnvironmentAndUpdate();
}
