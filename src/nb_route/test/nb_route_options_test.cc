/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include <stdio.h>

#include <fstream>
#include <string>
#include <vector>

#include <boost/assign/list_of.hpp>

#include "base/logging.h"
#include "nb_route/nb_route_options.h"
#include "testing/gunit.h"

using namespace std;
using boost::assign::list_of;
using NbRoute::Options;

static const char kConfigFile[] = "./nb_route_options_test.conf";

class OptionsTest : public ::testing::Test {
protected:
    OptionsTest() { }

    virtual void SetUp() {
        default_nb_address_.push_back("tcp:127.0.0.1:6641");
    }

    virtual void TearDown() {
        remove(kConfigFile);
    }

    void WriteConfigFile(const string &content) {
        ofstream out(kConfigFile);
        out << content;
        out.close();
    }

    vector<string> default_nb_address_;
    Options options_;
};

TEST_F(OptionsTest, NoArguments) {
    int argc = 1;
    char argv_0[] = "nb_route_options_test";
    char *argv[] = { argv_0 };

    EXPECT_TRUE(options_.Parse(argc, argv));

    EXPECT_EQ("/etc/contrail/contrail-nb-route.conf", options_.config_file());
    EXPECT_FALSE(options_.log_disable());
    EXPECT_EQ("<stdout>", options_.log_file());
    EXPECT_EQ(10, options_.log_files_count());
    EXPECT_EQ(10*1024*1024, options_.log_file_size());
    EXPECT_EQ("INFO", options_.log_level());
    EXPECT_FALSE(options_.use_syslog());
    EXPECT_EQ("LOG_LOCAL0", options_.syslog_facility());
    EXPECT_EQ(default_nb_address_, options_.nb_address());
    EXPECT_EQ(60000U, options_.nb_timeout_msec());
    EXPECT_EQ(options_.nb_timeout_msec(),
              options_.client_config().timeout_msec);
}

TEST_F(OptionsTest, CustomConfigFile) {
    WriteConfigFile(
        "[DEFAULT]\n"
        "log_file=/var/log/contrail/contrail-nb-route.log\n"
        "log_files_count=5\n"
        "log_file_size=1048576\n"
        "log_level=DEBUG\n"
        "use_syslog=1\n"
        "syslog_facility=LOG_LOCAL3\n"
        "\n"
        "[OVN_NB]\n"
        "nb_address=tcp:10.1.1.1:6641 tcp:10.1.1.2:6641 unix:/run/ovn/nb.sock\n"
        "timeout=5\n");

    int argc = 2;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./nb_route_options_test.conf";
    char *argv[] = { argv_0, argv_1 };

    EXPECT_TRUE(options_.Parse(argc, argv));

    vector<string> nb_address = list_of
        ("tcp:10.1.1.1:6641")("tcp:10.1.1.2:6641")("unix:/run/ovn/nb.sock");
    EXPECT_EQ(kConfigFile, options_.config_file());
    EXPECT_EQ("/var/log/contrail/contrail-nb-route.log", options_.log_file());
    EXPECT_EQ(5, options_.log_files_count());
    EXPECT_EQ(1048576, options_.log_file_size());
    EXPECT_EQ("DEBUG", options_.log_level());
    EXPECT_TRUE(options_.use_syslog());
    EXPECT_EQ("LOG_LOCAL3", options_.syslog_facility());
    EXPECT_EQ(nb_address, options_.nb_address());
    EXPECT_EQ(5000U, options_.nb_timeout_msec());
}

TEST_F(OptionsTest, CommandLineOverridesConfigFile) {
    WriteConfigFile(
        "[DEFAULT]\n"
        "log_level=DEBUG\n"
        "\n"
        "[OVN_NB]\n"
        "nb_address=tcp:10.1.1.1:6641\n"
        "timeout=5\n");

    int argc = 5;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./nb_route_options_test.conf";
    char argv_2[] = "--DEFAULT.log_level=WARN";
    char argv_3[] = "--OVN_NB.nb_address=ssl:10.2.2.2:6641";
    char argv_4[] = "--OVN_NB.timeout=30";
    char *argv[] = { argv_0, argv_1, argv_2, argv_3, argv_4 };

    EXPECT_TRUE(options_.Parse(argc, argv));

    vector<string> nb_address = list_of("ssl:10.2.2.2:6641");
    EXPECT_EQ("WARN", options_.log_level());
    EXPECT_EQ(nb_address, options_.nb_address());
    EXPECT_EQ(30000U, options_.nb_timeout_msec());
}

TEST_F(OptionsTest, LogDisable) {
    int argc = 3;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./no_such_file.conf";
    char argv_2[] = "--DEFAULT.log_disable";
    char *argv[] = { argv_0, argv_1, argv_2 };

    EXPECT_TRUE(options_.Parse(argc, argv));
    EXPECT_TRUE(options_.log_disable());
}

TEST_F(OptionsTest, InitLogging) {
    int argc = 4;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./no_such_file.conf";
    char argv_2[] = "--DEFAULT.log_disable";
    char argv_3[] = "--DEFAULT.log_level=WARN";
    char *argv[] = { argv_0, argv_1, argv_2, argv_3 };

    ASSERT_TRUE(options_.Parse(argc, argv));
    options_.InitLogging("nb_route_options_test");
    EXPECT_TRUE(LoggingDisabled());

    SetLoggingDisabled(false);
    LoggingInit();
}

TEST_F(OptionsTest, ZeroTimeout) {
    int argc = 3;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./no_such_file.conf";
    char argv_2[] = "--OVN_NB.timeout=0";
    char *argv[] = { argv_0, argv_1, argv_2 };

    EXPECT_FALSE(options_.Parse(argc, argv));
}

// Seconds that do not fit in a 32-bit millisecond count are rejected
// rather than wrapped.
TEST_F(OptionsTest, TimeoutOutOfRange) {
    int argc = 3;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./no_such_file.conf";
    char argv_2[] = "--OVN_NB.timeout=4294968";
    char *argv[] = { argv_0, argv_1, argv_2 };

    EXPECT_FALSE(options_.Parse(argc, argv));
}

TEST_F(OptionsTest, LargestTimeout) {
    int argc = 3;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./no_such_file.conf";
    char argv_2[] = "--OVN_NB.timeout=4294967";
    char *argv[] = { argv_0, argv_1, argv_2 };

    EXPECT_TRUE(options_.Parse(argc, argv));
    EXPECT_EQ(4294967000U, options_.nb_timeout_msec());
}

TEST_F(OptionsTest, InvalidNbAddress) {
    WriteConfigFile(
        "[OVN_NB]\n"
        "nb_address=tcp:10.1.1.1:6641 10.1.1.2:6641\n");

    int argc = 2;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./nb_route_options_test.conf";
    char *argv[] = { argv_0, argv_1 };

    EXPECT_FALSE(options_.Parse(argc, argv));
}

TEST_F(OptionsTest, NbAddressWithoutPort) {
    int argc = 3;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--conf_file=./no_such_file.conf";
    char argv_2[] = "--OVN_NB.nb_address=tcp:10.1.1.1";
    char *argv[] = { argv_0, argv_1, argv_2 };

    EXPECT_FALSE(options_.Parse(argc, argv));
}

TEST_F(OptionsTest, UnknownOption) {
    int argc = 2;
    char argv_0[] = "nb_route_options_test";
    char argv_1[] = "--OVN_NB.no_such_option=1";
    char *argv[] = { argv_0, argv_1 };

    EXPECT_FALSE(options_.Parse(argc, argv));
}

int main(int argc, char **argv) {
    LoggingInit();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
