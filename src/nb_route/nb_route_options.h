/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_NB_ROUTE_OPTIONS_H_
#define SRC_NB_ROUTE_NB_ROUTE_OPTIONS_H_

#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "nb_route/nb_client.h"

namespace NbRoute {

// Process command line/configuration file options for processes embedding
// the static route client.
class Options {
public:
    Options();
    bool Parse(int argc, char *argv[]);

    std::string config_file() const { return config_file_; }
    bool log_disable() const { return log_disable_; }
    std::string log_file() const { return log_file_; }
    int log_files_count() const { return log_files_count_; }
    long log_file_size() const { return log_file_size_; }
    std::string log_level() const { return log_level_; }
    bool use_syslog() const { return use_syslog_; }
    std::string syslog_facility() const { return syslog_facility_; }
    std::vector<std::string> nb_address() const {
        return client_config_.nb_address;
    }
    uint32_t nb_timeout_msec() const { return client_config_.timeout_msec; }
    const NbClientConfig &client_config() const { return client_config_; }

    // Configure log4cplus from the logging options.
    void InitLogging(const std::string &ident) const;

private:
    bool Process(int argc, char *argv[],
                 boost::program_options::options_description &cmdline_options);
    void Initialize(boost::program_options::options_description &options);
    bool ValidateClientConfig() const;

    std::string config_file_;
    bool log_disable_;
    std::string log_file_;
    int log_files_count_;
    long log_file_size_;
    std::string log_level_;
    bool use_syslog_;
    std::string syslog_facility_;
    NbClientConfig client_config_;

    std::vector<std::string> default_nb_address_;
    boost::program_options::options_description config_file_options_;
};

}  // namespace NbRoute

#endif  // SRC_NB_ROUTE_NB_ROUTE_OPTIONS_H_
