/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include "nb_route/nb_operation.h"

#include <sstream>
#include <boost/assign/list_of.hpp>
#include <boost/foreach.hpp>

#include "nb_route/named_uuid.h"

using boost::assign::list_of;
using std::string;
using std::vector;

namespace NbRoute {

const string kLogicalRouterTable("Logical_Router");
const string kStaticRouteTable("Logical_Router_Static_Route");

Operation::Operation(Type type) : type_(type), mutator_(MUTATOR_INSERT) {
}

Operation Operation::InsertRoute(const StaticRoute &route) {
    Operation op(INSERT_ROUTE);
    op.route_ = route;
    return op;
}

Operation Operation::UpdateRoute(const StaticRoute &route,
                                 const ColumnList &columns) {
    Operation op(UPDATE_ROUTE);
    op.route_ = route;
    op.columns_ = columns.empty() ? AllRouteColumns() : columns;
    return op;
}

Operation Operation::MutateRouterRoutes(const string &router, Mutator mutator,
                                        const vector<string> &uuids) {
    Operation op(MUTATE_ROUTER_ROUTES);
    op.router_ = router;
    op.mutator_ = mutator;
    op.uuids_ = uuids;
    return op;
}

Operation Operation::ClearRouterRoutes(const string &router) {
    Operation op(CLEAR_ROUTER_ROUTES);
    op.router_ = router;
    return op;
}

const Operation::ColumnList &Operation::AllRouteColumns() {
    static const ColumnList columns = list_of
        (COLUMN_ROUTE_TABLE)(COLUMN_POLICY)(COLUMN_IP_PREFIX)
        (COLUMN_NEXTHOP)(COLUMN_BFD)(COLUMN_OPTIONS)(COLUMN_EXTERNAL_IDS);
    return columns;
}

const char *Operation::ColumnName(RouteColumn column) {
    switch (column) {
    case COLUMN_ROUTE_TABLE:
        return "route_table";
    case COLUMN_POLICY:
        return "policy";
    case COLUMN_IP_PREFIX:
        return "ip_prefix";
    case COLUMN_NEXTHOP:
        return "nexthop";
    case COLUMN_BFD:
        return "bfd";
    case COLUMN_OPTIONS:
        return "options";
    case COLUMN_EXTERNAL_IDS:
        return "external_ids";
    }
    return "unknown";
}

const string &Operation::table() const {
    if (type_ == INSERT_ROUTE || type_ == UPDATE_ROUTE) {
        return kStaticRouteTable;
    }
    return kLogicalRouterTable;
}

string Operation::ToString() const {
    std::ostringstream out;
    switch (type_) {
    case INSERT_ROUTE:
        out << "insert " << table() << " " << route_.ToString();
        break;
    case UPDATE_ROUTE:
        out << "update " << table() << " " << route_.uuid << " columns";
        BOOST_FOREACH(RouteColumn column, columns_) {
            out << " " << ColumnName(column);
        }
        break;
    case MUTATE_ROUTER_ROUTES:
        out << "mutate " << table() << " " << router_ << " static_routes "
            << (mutator_ == MUTATOR_INSERT ? "insert " : "delete ")
            << UuidListToString(uuids_);
        break;
    case CLEAR_ROUTER_ROUTES:
        out << "update " << table() << " " << router_ << " static_routes []";
        break;
    }
    return out.str();
}

void StaticRouteOpBuilder::BuildCreate(const string &router,
                                       StaticRouteList *routes,
                                       OperationList *ops) {
    if (routes->empty()) {
        return;
    }
    vector<string> uuids;
    for (StaticRouteList::iterator it = routes->begin(); it != routes->end();
         ++it) {
        if (it->uuid.empty()) {
            it->uuid = GenerateNamedUuid();
        }
        it->policy = it->EffectivePolicy();
        ops->push_back(Operation::InsertRoute(*it));
        uuids.push_back(it->uuid);
    }
    ops->push_back(Operation::MutateRouterRoutes(router,
                       Operation::MUTATOR_INSERT, uuids));
}

void StaticRouteOpBuilder::BuildDelete(const string &router,
                                       const vector<string> &uuids,
                                       OperationList *ops) {
    if (uuids.empty()) {
        return;
    }
    ops->push_back(Operation::MutateRouterRoutes(router,
                       Operation::MUTATOR_DELETE, uuids));
}

void StaticRouteOpBuilder::BuildUpdate(const StaticRoute &route,
                                       const Operation::ColumnList &columns,
                                       OperationList *ops) {
    ops->push_back(Operation::UpdateRoute(route, columns));
}

void StaticRouteOpBuilder::BuildClear(const string &router,
                                      OperationList *ops) {
    ops->push_back(Operation::ClearRouterRoutes(router));
}

}  // namespace NbRoute
