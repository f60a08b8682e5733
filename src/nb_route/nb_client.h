/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_NB_CLIENT_H_
#define SRC_NB_ROUTE_NB_CLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include <boost/system/error_code.hpp>

#include "nb_route/nb_operation.h"
#include "nb_route/static_route.h"
#include "nb_route/static_route_filter.h"

namespace NbRoute {

// Settings shared by the client and the layers that drive it.
struct NbClientConfig {
    static const uint32_t kDefaultTimeoutMSec = 60000;

    NbClientConfig() : timeout_msec(kDefaultTimeoutMSec) { }

    // Connection strings, e.g. "tcp:127.0.0.1:6641".
    std::vector<std::string> nb_address;
    // Bound on each read-then-dereference sequence.
    uint32_t timeout_msec;
};

//
// This is the base class for interactions with the northbound database that
// stores logical routers and their static routes. Connection management,
// schema handling and the wire protocol live in the implementation.
//
// Every method returns an error_code of the nb_route category; on failure
// *error_msg (when not NULL) describes the problem.
//
class NbClient {
public:
    NbClient() { }
    virtual ~NbClient() { }

    // kNotFound if no router has this name.
    virtual boost::system::error_code GetLogicalRouter(
        const std::string &name, LogicalRouter *router,
        std::string *error_msg) = 0;

    // kNotFound if the row does not exist (or no longer exists).
    virtual boost::system::error_code GetStaticRoute(
        const std::string &uuid, StaticRoute *route,
        std::string *error_msg) = 0;

    // All rows of the static route table accepted by predicate, in any order.
    virtual boost::system::error_code ListStaticRoutes(
        const StaticRoutePredicate &predicate, StaticRouteList *routes,
        std::string *error_msg) = 0;

    // Apply ops atomically as the transaction named name: either every
    // operation takes effect or none does.
    virtual boost::system::error_code Transact(
        const std::string &name, const OperationList &ops,
        std::string *error_msg) = 0;
};

}  // namespace NbRoute

#endif  // SRC_NB_ROUTE_NB_CLIENT_H_
