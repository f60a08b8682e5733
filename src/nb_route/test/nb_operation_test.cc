/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include <string>
#include <vector>

#include <boost/assign/list_of.hpp>

#include "base/logging.h"
#include "nb_route/named_uuid.h"
#include "nb_route/nb_error.h"
#include "nb_route/nb_operation.h"
#include "nb_route/nb_transaction.h"
#include "nb_route/test/nb_client_mock.h"
#include "testing/gunit.h"

using namespace NbRoute;
using boost::assign::list_of;
using boost::system::error_code;
using std::string;
using std::vector;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgPointee;
using ::testing::StrEq;

class OperationTest : public ::testing::Test {
protected:
    StaticRoute BuildRoute(const string &prefix, const string &nexthop) {
        StaticRoute route;
        route.ip_prefix = prefix;
        route.nexthop = nexthop;
        return route;
    }
};

TEST_F(OperationTest, BuildCreate) {
    StaticRouteList routes;
    routes.push_back(BuildRoute("10.0.0.0/24", "1.1.1.1"));
    routes.push_back(BuildRoute("10.0.0.0/24", "1.1.1.2"));
    routes[1].uuid = GenerateNamedUuid();
    string preset = routes[1].uuid;

    OperationList ops;
    StaticRouteOpBuilder::BuildCreate("lr1", &routes, &ops);

    ASSERT_EQ(3U, ops.size());
    EXPECT_TRUE(IsNamedUuid(routes[0].uuid));
    EXPECT_EQ(preset, routes[1].uuid);
    EXPECT_NE(routes[0].uuid, routes[1].uuid);

    EXPECT_EQ(Operation::INSERT_ROUTE, ops[0].type());
    EXPECT_EQ(kStaticRouteTable, ops[0].table());
    EXPECT_EQ(routes[0].uuid, ops[0].route().uuid);
    EXPECT_EQ(kPolicyDstIp, ops[0].route().policy);
    EXPECT_EQ(Operation::INSERT_ROUTE, ops[1].type());

    EXPECT_EQ(Operation::MUTATE_ROUTER_ROUTES, ops[2].type());
    EXPECT_EQ(kLogicalRouterTable, ops[2].table());
    EXPECT_EQ("lr1", ops[2].router());
    EXPECT_EQ(Operation::MUTATOR_INSERT, ops[2].mutator());
    vector<string> uuids = list_of(routes[0].uuid)(routes[1].uuid);
    EXPECT_EQ(uuids, ops[2].uuids());
}

TEST_F(OperationTest, BuildCreateEmpty) {
    StaticRouteList routes;
    OperationList ops;
    StaticRouteOpBuilder::BuildCreate("lr1", &routes, &ops);
    EXPECT_TRUE(ops.empty());
}

TEST_F(OperationTest, BuildDelete) {
    OperationList ops;
    StaticRouteOpBuilder::BuildDelete("lr1", vector<string>(), &ops);
    EXPECT_TRUE(ops.empty());

    vector<string> uuids = list_of("uuid-1")("uuid-2");
    StaticRouteOpBuilder::BuildDelete("lr1", uuids, &ops);
    ASSERT_EQ(1U, ops.size());
    EXPECT_EQ(Operation::MUTATE_ROUTER_ROUTES, ops[0].type());
    EXPECT_EQ(Operation::MUTATOR_DELETE, ops[0].mutator());
    EXPECT_EQ(uuids, ops[0].uuids());
    EXPECT_EQ("mutate Logical_Router lr1 static_routes delete "
              "[uuid-1 uuid-2]", ops[0].ToString());
}

TEST_F(OperationTest, BuildUpdate) {
    StaticRoute route = BuildRoute("10.0.0.0/24", "1.1.1.1");
    route.uuid = "uuid-1";

    OperationList ops;
    StaticRouteOpBuilder::BuildUpdate(route, Operation::ColumnList(), &ops);
    Operation::ColumnList columns = list_of(Operation::COLUMN_NEXTHOP);
    StaticRouteOpBuilder::BuildUpdate(route, columns, &ops);

    ASSERT_EQ(2U, ops.size());
    EXPECT_EQ(Operation::UPDATE_ROUTE, ops[0].type());
    EXPECT_EQ(Operation::AllRouteColumns(), ops[0].columns());
    EXPECT_EQ(7U, ops[0].columns().size());
    EXPECT_EQ(columns, ops[1].columns());
    EXPECT_EQ("update Logical_Router_Static_Route uuid-1 columns nexthop",
              ops[1].ToString());
}

TEST_F(OperationTest, BuildClear) {
    OperationList ops;
    StaticRouteOpBuilder::BuildClear("lr1", &ops);
    ASSERT_EQ(1U, ops.size());
    EXPECT_EQ(Operation::CLEAR_ROUTER_ROUTES, ops[0].type());
    EXPECT_EQ("lr1", ops[0].router());
    EXPECT_EQ("update Logical_Router lr1 static_routes []",
              ops[0].ToString());
}

TEST_F(OperationTest, ColumnName) {
    EXPECT_STREQ("route_table",
                 Operation::ColumnName(Operation::COLUMN_ROUTE_TABLE));
    EXPECT_STREQ("bfd", Operation::ColumnName(Operation::COLUMN_BFD));
    EXPECT_STREQ("external_ids",
                 Operation::ColumnName(Operation::COLUMN_EXTERNAL_IDS));
}

class TransactionTest : public ::testing::Test {
protected:
    TransactionTest() : executor_(&client_) { }

    NbClientMock client_;
    TransactionExecutor executor_;
};

TEST_F(TransactionTest, EmptyOperationList) {
    EXPECT_CALL(client_, Transact(_, _, _)).Times(0);
    string msg;
    EXPECT_FALSE(executor_.Commit("lr-route-del", OperationList(), "noop",
                                  &msg));
    EXPECT_TRUE(msg.empty());
}

TEST_F(TransactionTest, Success) {
    OperationList ops;
    StaticRouteOpBuilder::BuildClear("lr1", &ops);
    EXPECT_CALL(client_, Transact(StrEq("lr-route-clear"), _, _))
        .WillOnce(Return(error_code()));
    string msg;
    EXPECT_FALSE(executor_.Commit("lr-route-clear", ops, "clear", &msg));
    EXPECT_TRUE(msg.empty());
}

TEST_F(TransactionTest, StoreFailure) {
    OperationList ops;
    StaticRouteOpBuilder::BuildClear("lr1", &ops);
    EXPECT_CALL(client_, Transact(StrEq("lr-route-clear"), _, _))
        .WillOnce(DoAll(SetArgPointee<2>(string("constraint violation")),
                        Return(make_error_code(kTransactionError))));
    string msg;
    error_code ec = executor_.Commit("lr-route-clear", ops,
        "clear logical router lr1 static routes", &msg);
    EXPECT_EQ(make_error_code(kTransactionError), ec);
    EXPECT_EQ("clear logical router lr1 static routes: constraint violation",
              msg);
}

TEST_F(TransactionTest, StoreFailureWithoutMessage) {
    OperationList ops;
    StaticRouteOpBuilder::BuildClear("lr1", &ops);
    EXPECT_CALL(client_, Transact(_, _, _))
        .WillOnce(Return(make_error_code(kTimeout)));
    string msg;
    error_code ec = executor_.Commit("lr-route-clear", ops, "clear", &msg);
    EXPECT_EQ(make_error_code(kTransactionError), ec);
    EXPECT_EQ("clear: request timed out", msg);
}

int main(int argc, char **argv) {
    LoggingInit();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
