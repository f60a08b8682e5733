/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include "nb_route/nb_route_options.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/foreach.hpp>

#include "base/logging.h"

using namespace std;
namespace opt = boost::program_options;

namespace NbRoute {

const uint32_t NbClientConfig::kDefaultTimeoutMSec;

namespace {

template <typename ValueType>
bool GetOptValue(const opt::variables_map &var_map, ValueType &var,
                 const string &val) {
    if (!var_map.count(val)) {
        return false;
    }
    var = var_map[val].as<ValueType>();
    return true;
}

// List values may come as several tokens or as one whitespace separated
// string (config file form); flatten both.
bool GetOptValue(const opt::variables_map &var_map, vector<string> &var,
                 const string &val) {
    if (!var_map.count(val)) {
        return false;
    }
    var.clear();
    BOOST_FOREACH(const string &item, var_map[val].as<vector<string> >()) {
        istringstream ss(item);
        copy(istream_iterator<string>(ss), istream_iterator<string>(),
             back_inserter(var));
    }
    return true;
}

bool ValidateNbAddress(const string &address) {
    if (boost::starts_with(address, "tcp:") ||
        boost::starts_with(address, "ssl:")) {
        // tcp:<host>:<port>
        size_t port_pos = address.rfind(':');
        return port_pos > 4 && port_pos + 1 < address.size();
    }
    if (boost::starts_with(address, "unix:")) {
        return address.size() > 5;
    }
    return false;
}

}  // namespace

Options::Options()
    : log_disable_(false), log_files_count_(10),
      log_file_size_(10 * 1024 * 1024), use_syslog_(false) {
}

bool Options::Parse(int argc, char *argv[]) {
    opt::options_description cmdline_options("Allowed options");
    Initialize(cmdline_options);

    try {
        return Process(argc, argv, cmdline_options);
    } catch (boost::program_options::error &e) {
        cout << "Error " << e.what() << endl;
    }

    return false;
}

// Initialize the command line option tags with appropriate default values.
// Options can come from a config file as well. By default, we read options
// from /etc/contrail/contrail-nb-route.conf
void Options::Initialize(opt::options_description &cmdline_options) {
    opt::options_description generic("Generic options");

    // Command line only options.
    generic.add_options()
        ("conf_file", opt::value<string>()->default_value(
                                    "/etc/contrail/contrail-nb-route.conf"),
             "Configuration file")
        ("help", "help message")
    ;

    default_nb_address_.clear();
    default_nb_address_.push_back("tcp:127.0.0.1:6641");

    // Command line and config file options.
    opt::options_description config("Configuration options");
    config.add_options()
        ("DEFAULT.log_disable", opt::bool_switch(&log_disable_),
             "Disable logging")
        ("DEFAULT.log_file", opt::value<string>()->default_value("<stdout>"),
             "Filename for the logs to be written to")
        ("DEFAULT.log_files_count",
             opt::value<int>()->default_value(10),
             "Maximum log file roll over index")
        ("DEFAULT.log_file_size",
             opt::value<long>()->default_value(10*1024*1024),
             "Maximum size of the log file")
        ("DEFAULT.log_level", opt::value<string>()->default_value("INFO"),
             "Severity level for local logging")
        ("DEFAULT.use_syslog", opt::bool_switch(&use_syslog_),
             "Enable logging to syslog")
        ("DEFAULT.syslog_facility",
             opt::value<string>()->default_value("LOG_LOCAL0"),
             "Syslog facility to receive log lines")

        ("OVN_NB.nb_address",
             opt::value<vector<string> >()->default_value(
             default_nb_address_, "tcp:127.0.0.1:6641"),
             "Northbound database connection list")
        ("OVN_NB.timeout",
             opt::value<uint32_t>()->default_value(
                 NbClientConfig::kDefaultTimeoutMSec / 1000),
             "Northbound request timeout in seconds")
        ;

    config_file_options_.add(config);
    cmdline_options.add(generic).add(config);
}

// Process command line options. They can come from a conf file as well.
// Options from command line always override those from the config file.
bool Options::Process(int argc, char *argv[],
                      opt::options_description &cmdline_options) {
    // Process options off command line first.
    opt::variables_map var_map;
    opt::store(opt::parse_command_line(argc, argv, cmdline_options), var_map);

    // Process options off configuration file.
    GetOptValue<string>(var_map, config_file_, "conf_file");
    ifstream config_file_in;
    config_file_in.open(config_file_.c_str());
    if (config_file_in.good()) {
        opt::store(opt::parse_config_file(config_file_in, config_file_options_),
                   var_map);
    }
    config_file_in.close();

    opt::notify(var_map);

    if (var_map.count("help")) {
        cout << cmdline_options << endl;
        return false;
    }

    GetOptValue<string>(var_map, log_file_, "DEFAULT.log_file");
    GetOptValue<int>(var_map, log_files_count_, "DEFAULT.log_files_count");
    GetOptValue<long>(var_map, log_file_size_, "DEFAULT.log_file_size");
    GetOptValue<string>(var_map, log_level_, "DEFAULT.log_level");
    GetOptValue<string>(var_map, syslog_facility_, "DEFAULT.syslog_facility");

    GetOptValue(var_map, client_config_.nb_address, "OVN_NB.nb_address");
    uint32_t timeout_sec = 0;
    GetOptValue<uint32_t>(var_map, timeout_sec, "OVN_NB.timeout");
    if (timeout_sec > numeric_limits<uint32_t>::max() / 1000) {
        cout << "Invalid OVN_NB.timeout: " << timeout_sec
             << " seconds is out of range" << endl;
        return false;
    }
    client_config_.timeout_msec = timeout_sec * 1000;

    return ValidateClientConfig();
}

bool Options::ValidateClientConfig() const {
    if (client_config_.timeout_msec == 0) {
        cout << "Invalid OVN_NB.timeout: must be greater than zero" << endl;
        return false;
    }
    if (client_config_.nb_address.empty()) {
        cout << "Invalid OVN_NB.nb_address: empty server list" << endl;
        return false;
    }
    BOOST_FOREACH(const string &address, client_config_.nb_address) {
        if (!ValidateNbAddress(address)) {
            cout << "Invalid OVN_NB.nb_address: " << address << endl;
            return false;
        }
    }
    return true;
}

void Options::InitLogging(const string &ident) const {
    LoggingInit(log_file_, log_file_size_, log_files_count_, use_syslog_,
                syslog_facility_, ident, log_level_);
    if (log_disable_) {
        SetLoggingDisabled(true);
    }
}

}  // namespace NbRoute
