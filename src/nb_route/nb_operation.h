/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_NB_OPERATION_H_
#define SRC_NB_ROUTE_NB_OPERATION_H_

#include <string>
#include <vector>

#include "nb_route/static_route.h"

namespace NbRoute {

extern const std::string kLogicalRouterTable;
extern const std::string kStaticRouteTable;

//
// One low-level operation of a northbound transaction. Operations are plain
// values; they are interpreted by the NbClient that commits them.
//
class Operation {
public:
    enum Type {
        INSERT_ROUTE,           // insert route() as a new row
        UPDATE_ROUTE,           // update columns() of the row route().uuid
        MUTATE_ROUTER_ROUTES,   // insert/delete uuids() in router's routes
        CLEAR_ROUTER_ROUTES,    // set router's routes to the empty set
    };

    enum Mutator {
        MUTATOR_INSERT,
        MUTATOR_DELETE,
    };

    enum RouteColumn {
        COLUMN_ROUTE_TABLE,
        COLUMN_POLICY,
        COLUMN_IP_PREFIX,
        COLUMN_NEXTHOP,
        COLUMN_BFD,
        COLUMN_OPTIONS,
        COLUMN_EXTERNAL_IDS,
    };
    typedef std::vector<RouteColumn> ColumnList;

    static Operation InsertRoute(const StaticRoute &route);
    static Operation UpdateRoute(const StaticRoute &route,
                                 const ColumnList &columns);
    static Operation MutateRouterRoutes(const std::string &router,
                                        Mutator mutator,
                                        const std::vector<std::string> &uuids);
    static Operation ClearRouterRoutes(const std::string &router);

    // All columns an update may touch.
    static const ColumnList &AllRouteColumns();
    static const char *ColumnName(RouteColumn column);

    Type type() const { return type_; }
    const std::string &table() const;
    const StaticRoute &route() const { return route_; }
    const ColumnList &columns() const { return columns_; }
    const std::string &router() const { return router_; }
    Mutator mutator() const { return mutator_; }
    const std::vector<std::string> &uuids() const { return uuids_; }

    std::string ToString() const;

private:
    explicit Operation(Type type);

    Type type_;
    StaticRoute route_;
    ColumnList columns_;
    std::string router_;
    Mutator mutator_;
    std::vector<std::string> uuids_;
};

typedef std::vector<Operation> OperationList;

//
// Translates route level changes into operation lists. Creation always
// pairs the row insert with the insertion of its uuid into the router's
// route set, and deletion is expressed only as removal from that set: the
// store reclaims rows that are no longer referenced.
//
class StaticRouteOpBuilder {
public:
    // Routes without a uuid get a fresh named uuid, written back to *routes.
    static void BuildCreate(const std::string &router, StaticRouteList *routes,
                            OperationList *ops);
    static void BuildDelete(const std::string &router,
                            const std::vector<std::string> &uuids,
                            OperationList *ops);
    // An empty column list updates every column.
    static void BuildUpdate(const StaticRoute &route,
                            const Operation::ColumnList &columns,
                            OperationList *ops);
    static void BuildClear(const std::string &router, OperationList *ops);
};

}  // namespace NbRoute

#endif  // SRC_NB_ROUTE_NB_OPERATION_H_
