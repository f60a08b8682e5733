/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_STATIC_ROUTE_MANAGER_H_
#define SRC_NB_ROUTE_STATIC_ROUTE_MANAGER_H_

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "base/util.h"
#include "nb_route/nb_client.h"
#include "nb_route/nb_operation.h"
#include "nb_route/nb_transaction.h"
#include "nb_route/static_route.h"
#include "nb_route/static_route_filter.h"

namespace NbRoute {

//
// Keeps the static routes of logical routers in the northbound database in
// line with the routing intent supplied by the caller.
//
// The manager holds no state besides the client and its configuration, so a
// single instance may be shared by concurrent workers. Each call blocks
// until its transaction(s) complete. Reads that walk a router's route set
// are not transactional: references to rows deleted in the meantime are
// skipped rather than reported. Retry on failure is the caller's business;
// every mutation is safe to re-run from scratch.
//
// All methods return an error_code of the nb_route category and, when
// error_msg is not NULL, describe failures there.
//
class StaticRouteManager {
public:
    typedef std::vector<std::string> NexthopList;

    StaticRouteManager(NbClient *client, const NbClientConfig &config);

    //
    // Queries
    //

    // Exact lookup on (table, policy, prefix, nexthop). Zero matches is
    // kNotFound unless ignore_not_found, in which case *route is left empty.
    // More than one match is kIntegrityError.
    boost::system::error_code GetStaticRoute(
        const std::string &router, const std::string &route_table,
        const std::string &policy, const std::string &ip_prefix,
        const std::string &nexthop, bool ignore_not_found,
        boost::optional<StaticRoute> *route, std::string *error_msg) const;

    boost::system::error_code GetStaticRouteByUuid(
        const std::string &uuid, StaticRoute *route,
        std::string *error_msg) const;

    boost::system::error_code StaticRouteExists(
        const std::string &router, const std::string &route_table,
        const std::string &policy, const std::string &ip_prefix,
        const std::string &nexthop, bool *exists,
        std::string *error_msg) const;

    // Routes attached to router accepted by filter. kNotFound if the router
    // does not exist, kTimeout if the walk exceeds the configured timeout.
    boost::system::error_code ListStaticRoutes(
        const std::string &router, const StaticRouteFilter &filter,
        StaticRouteList *routes, std::string *error_msg) const;

    boost::system::error_code ListStaticRoutesByOption(
        const std::string &router, const std::string &key,
        const std::string &value, StaticRouteList *routes,
        std::string *error_msg) const;

    // Build (but do not commit) a route with a fresh named uuid. Leaves
    // *route empty if the full key already exists on the router.
    boost::system::error_code NewStaticRoute(
        const std::string &router, const std::string &route_table,
        const std::string &policy, const std::string &ip_prefix,
        const std::string &nexthop, const boost::optional<std::string> &bfd,
        const StringMap &external_ids, boost::optional<StaticRoute> *route,
        std::string *error_msg) const;

    //
    // Mutations
    //

    // Create routes and attach them to router in one transaction.
    boost::system::error_code CreateStaticRoutes(
        const std::string &router, const StaticRouteList &routes,
        std::string *error_msg) const;

    // Converge the ECMP group (table, policy, prefix) to nexthops. Undesired
    // nexthops are detached first, then missing ones are created, each step
    // in its own transaction. A route whose BFD reference differs from a set
    // bfd is left untouched.
    boost::system::error_code ReconcileStaticRoute(
        const std::string &router, const std::string &route_table,
        const std::string &policy, const std::string &ip_prefix,
        const boost::optional<std::string> &bfd, const StringMap &external_ids,
        const NexthopList &nexthops, std::string *error_msg) const;

    // Write columns of route (all columns if empty) to the row route->uuid.
    boost::system::error_code UpdateStaticRoute(
        const StaticRoute *route, const Operation::ColumnList &columns,
        std::string *error_msg) const;

    // Remove the route with nexthop, or the whole group if nexthop is empty.
    // Missing router or group is not an error.
    boost::system::error_code DeleteStaticRoute(
        const std::string &router, const std::string &route_table,
        const std::string &policy, const std::string &ip_prefix,
        const std::string &nexthop, std::string *error_msg) const;

    boost::system::error_code DeleteStaticRouteByUuid(
        const std::string &router, const std::string &uuid,
        std::string *error_msg) const;

    boost::system::error_code DeleteStaticRoutesByExternalIds(
        const std::string &router, const StringMap &external_ids,
        std::string *error_msg) const;

    // Each candidate names a (table, policy, prefix) key and the nexthop to
    // remove; an empty nexthop removes every route of the key.
    boost::system::error_code BatchDeleteStaticRoutes(
        const std::string &router, const StaticRouteList &candidates,
        std::string *error_msg) const;

    // Truncate the router's route set without reading any route.
    boost::system::error_code ClearStaticRoutes(
        const std::string &router, std::string *error_msg) const;

    const NbClientConfig &config() const { return config_; }

private:
    boost::system::error_code ValidateRouterName(
        const std::string &router, std::string *error_msg) const;
    boost::system::error_code LookupRouter(
        const std::string &router, bool ignore_not_found,
        LogicalRouter *lr, bool *found, std::string *error_msg) const;
    boost::system::error_code ListByPredicate(
        const std::string &router, const StaticRoutePredicate &predicate,
        StaticRouteList *routes, std::string *error_msg) const;
    boost::system::error_code DetachStaticRoutes(
        const std::string &router, const std::vector<std::string> &uuids,
        std::string *error_msg) const;
    StaticRoute BuildStaticRoute(
        const std::string &route_table, const std::string &policy,
        const std::string &ip_prefix, const std::string &nexthop,
        const boost::optional<std::string> &bfd,
        const StringMap &external_ids) const;

    NbClient *client_;
    NbClientConfig config_;
    TransactionExecutor executor_;

    DISALLOW_COPY_AND_ASSIGN(StaticRouteManager);
};

}  // namespace NbRoute

#endif  // SRC_NB_ROUTE_STATIC_ROUTE_MANAGER_H_
