/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include "nb_route/static_route_manager.h"

#include <map>
#include <set>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/foreach.hpp>

#include "nb_route/named_uuid.h"
#include "nb_route/nb_error.h"
#include "nb_route/nb_route_log.h"

using boost::system::error_code;
using std::map;
using std::ostringstream;
using std::set;
using std::string;
using std::vector;

namespace NbRoute {

namespace {

const char kTxnAddRoutes[] = "lr-routes-add";
const char kTxnDeleteRoutes[] = "lr-route-del";
const char kTxnClearRoutes[] = "lr-route-clear";
const char kTxnUpdateRoute[] = "lr-route-update";

string RouteDescription(const string &route_table, const string &policy,
                        const string &ip_prefix, const string &nexthop) {
    ostringstream out;
    out << "route_table '" << route_table << "' policy " << policy
        << " ip_prefix " << ip_prefix << " nexthop " << nexthop;
    return out.str();
}

//
// Report a client failure under context. Codes of other categories
// (transport errors) become kTransactionError; ours are kept.
//
error_code ClientError(const error_code &ec, const string &context,
                       const string &msg, string *error_msg) {
    string text = context + ": " + (msg.empty() ? ec.message() : msg);
    if (ec.category() != nb_error_category()) {
        return SetError(kTransactionError, text, error_msg);
    }
    if (error_msg) {
        *error_msg = text;
    }
    return ec;
}

vector<string> RouteUuids(const StaticRouteList &routes) {
    vector<string> uuids;
    BOOST_FOREACH(const StaticRoute &route, routes) {
        uuids.push_back(route.uuid);
    }
    return uuids;
}

//
// Selects the routes of one router whose key is named by a batch delete
// request. An empty nexthop in the request selects the whole key.
//
class BatchDeleteMatcher {
public:
    typedef map<StaticRouteKey, string> KeyNexthopMap;

    BatchDeleteMatcher(const LogicalRouter &router,
                       const KeyNexthopMap &requests)
        : router_(router), requests_(requests) {
    }

    bool operator()(const StaticRoute &route) const {
        if (!router_.HasStaticRoute(route.uuid)) {
            return false;
        }
        KeyNexthopMap::const_iterator it = requests_.find(route.GetKey());
        if (it == requests_.end()) {
            return false;
        }
        return it->second.empty() || it->second == route.nexthop;
    }

private:
    const LogicalRouter &router_;
    const KeyNexthopMap &requests_;
};

}  // namespace

StaticRouteManager::StaticRouteManager(NbClient *client,
                                       const NbClientConfig &config)
    : client_(client), config_(config), executor_(client) {
}

error_code StaticRouteManager::ValidateRouterName(const string &router,
                                                  string *error_msg) const {
    if (router.empty()) {
        return SetError(kValidationError,
                        "the logical router name is required", error_msg);
    }
    return error_code();
}

error_code StaticRouteManager::LookupRouter(const string &router,
                                            bool ignore_not_found,
                                            LogicalRouter *lr, bool *found,
                                            string *error_msg) const {
    *found = false;
    string msg;
    error_code ec = client_->GetLogicalRouter(router, lr, &msg);
    if (!ec) {
        *found = true;
        return ec;
    }
    if (ec == kNotFound && ignore_not_found) {
        return error_code();
    }
    return ClientError(ec, "get logical router " + router, msg, error_msg);
}

//
// Read the router, then dereference each route it holds. Rows deleted after
// the router was read are skipped. The whole walk is bounded by the
// configured timeout.
//
error_code StaticRouteManager::ListByPredicate(
    const string &router, const StaticRoutePredicate &predicate,
    StaticRouteList *routes, string *error_msg) const {
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }

    boost::posix_time::ptime deadline =
        boost::posix_time::microsec_clock::universal_time() +
        boost::posix_time::milliseconds(config_.timeout_msec);

    LogicalRouter lr;
    bool found;
    ec = LookupRouter(router, false, &lr, &found, error_msg);
    if (ec) {
        return ec;
    }

    StaticRouteList result;
    BOOST_FOREACH(const string &uuid, lr.static_routes) {
        if (boost::posix_time::microsec_clock::universal_time() > deadline) {
            ostringstream out;
            out << "list static routes of logical router " << router
                << ": timed out after " << config_.timeout_msec << " ms";
            NB_ROUTE_LOG(WARN, router, out.str());
            return SetError(kTimeout, out.str(), error_msg);
        }

        StaticRoute route;
        string msg;
        ec = client_->GetStaticRoute(uuid, &route, &msg);
        if (ec == kNotFound) {
            NB_ROUTE_LOG(DEBUG, router, "skipping dangling static route "
                         "reference " << uuid);
            continue;
        }
        if (ec) {
            return ClientError(ec, "get static route " + uuid +
                               " of logical router " + router, msg,
                               error_msg);
        }
        route.policy = route.EffectivePolicy();
        if (predicate(route)) {
            result.push_back(route);
        }
    }

    routes->swap(result);
    return error_code();
}

error_code StaticRouteManager::ListStaticRoutes(const string &router,
                                                const StaticRouteFilter &filter,
                                                StaticRouteList *routes,
                                                string *error_msg) const {
    return ListByPredicate(router, filter, routes,
                               msg, error_msg);
}

error_code StaticRouteManager::ListStaticRoutesByOption(
    const string &router, const string &key, const string &value,
    StaticRouteList *routes, string *error_msg) const {
    StaticRouteFilter filter;
    filter.set_option(key, value);
    return ListByPredicate(router, filter, routes, error_msg);
}

error_code StaticRouteManager::GetStaticRoute(
    const string &router, const string &route_table, const string &policy,
    const string &ip_prefix, const string &nexthop, bool ignore_not_found,
    boost::optional<StaticRoute> *route, string *error_msg) const {
    *route = boost::none;
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }

    string description = RouteDescription(route_table,
        NormalizePolicy(policy), ip_prefix, nexthop);
    StaticRouteList routes;
    ec = ListByPredicate(router,
        StaticRouteFilter::ForRoute(route_table, policy, ip_prefix, nexthop),
        &routes, error_msg);
    if (ec) {
        PrependErrorContext("get logical router " + router +
                            " static route '" + description + "'", error_msg);
        return ec;
    }

    if (routes.empty()) {
        if (ignore_not_found) {
            return error_code();
        }
        return SetError(kNotFound, "not found logical router " + router +
                        " static route '" + description + "'", error_msg);
    }
    if (routes.size() > 1) {
        NB_ROUTE_LOG(ERROR, router, "duplicate static route '" << description
                     << "': " << UuidListToString(RouteUuids(routes)));
        return SetError(kIntegrityError, "more than one static route '" +
                        description + "' in logical router " + router,
                        error_msg);
    }

    *route = routes.front();
    return error_code();
}

error_code StaticRouteManager::GetStaticRouteByUuid(const string &uuid,
                                                    StaticRoute *route,
                                                    string *error_msg) const {
    if (uuid.empty()) {
        return SetError(kValidationError, "the static route uuid is required",
                        error_msg);
    }
    string msg;
    error_code ec = client_->GetStaticRoute(uuid, route, &msg);
    if (ec) {
        return ClientError(ec, "get static route " + uuid, msg, error_msg);
    }
    route->policy = route->EffectivePolicy();
    return ec;
}

error_code StaticRouteManager::StaticRouteExists(
    const string &router, const string &route_table, const string &policy,
    const string &ip_prefix, const string &nexthop, bool *exists,
    string *error_msg) const {
    *exists = false;
    boost::optional<StaticRoute> route;
    error_code ec = GetStaticRoute(router, route_table, policy, ip_prefix,
                                   nexthop, true, &route, error_msg);
    if (ec) {
        return ec;
    }
    *exists = route.is_initialized();
    return ec;
}

StaticRoute StaticRouteManager::BuildStaticRoute(
    const string &route_table, const string &policy, const string &ip_prefix,
    const string &nexthop, const boost::optional<string> &bfd,
    const StringMap &external_ids) const {
    StaticRoute route;
    route.uuid = GenerateNamedUuid();
    route.route_table = route_table;
    route.policy = NormalizePolicy(policy);
    route.ip_prefix = ip_prefix;
    route.nexthop = nexthop;
    route.external_ids = external_ids;
    if (bfd) {
        route.bfd = bfd;
        route.options[kOptionBfdEcmp] = "true";
    }
    return route;
}

error_code StaticRouteManager::NewStaticRoute(
    const string &router, const string &route_table, const string &policy,
    const string &ip_prefix, const string &nexthop,
    const boost::optional<string> &bfd, const StringMap &external_ids,
    boost::optional<StaticRoute> *route, string *error_msg) const {
    *route = boost::none;
    boost::optional<StaticRoute> existing;
    error_code ec = GetStaticRoute(router, route_table, policy, ip_prefix,
                                   nexthop, true, &existing, error_msg);
    if (ec) {
        return ec;
    }
    if (existing) {
        NB_ROUTE_LOG(DEBUG, router, "static route '" <<
                     RouteDescription(route_table, NormalizePolicy(policy),
                                      ip_prefix, nexthop) <<
                     "' already exists as " << existing->uuid);
        return ec;
    }
    *route = BuildStaticRoute(route_table, policy, ip_prefix, nexthop, bfd,
                              external_ids);
    return ec;
}

error_code StaticRouteManager::CreateStaticRoutes(const string &router,
                                                  const StaticRouteList &routes,
                                                  string *error_msg) const {
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }
    if (routes.empty()) {
        return ec;
    }

    LogicalRouter lr;
    bool found;
    ec = LookupRouter(router, false, &lr, &found, error_msg);
    if (ec) {
        PrependErrorContext("generate operations for adding static routes to "
                            "logical router " + router, error_msg);
        return ec;
    }

    StaticRouteList created(routes);
    OperationList ops;
    StaticRouteOpBuilder::BuildCreate(router, &created, &ops);

    vector<string> uuids = RouteUuids(created);
    NB_ROUTE_LOG(INFO, router, "adding static routes " <<
                 UuidListToString(uuids));
    return executor_.Commit(kTxnAddRoutes, ops,
        "add static routes " + UuidListToString(uuids) +
        " to logical router " + router, error_msg);
}

error_code StaticRouteManager::ReconcileStaticRoute(
    const string &router, const string &route_table, const string &policy,
    const string &ip_prefix, const boost::optional<string> &bfd,
    const StringMap &external_ids, const NexthopList &nexthops,
    string *error_msg) const {
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }

    StaticRouteFilter filter;
    filter.set_route_table(route_table).set_policy(policy)
        .set_ip_prefix(ip_prefix);
    StaticRouteList routes;
    ec = ListByPredicate(router, filter, &routes, error_msg);
    if (ec) {
        PrependErrorContext("list static routes of logical router " + router,
                            error_msg);
        return ec;
    }

    set<string> desired(nexthops.begin(), nexthops.end());
    set<string> existing;
    vector<string> to_delete;
    BOOST_FOREACH(const StaticRoute &route, routes) {
        if (STLKeyExists(desired, route.nexthop)) {
            existing.insert(route.nexthop);
            continue;
        }
        // Routes bound to another BFD session belong to another owner.
        if (route.has_bfd() && bfd && *route.bfd != *bfd) {
            continue;
        }
        to_delete.push_back(route.uuid);
    }

    StaticRouteList to_create;
    BOOST_FOREACH(const string &nexthop, nexthops) {
        if (STLKeyExists(existing, nexthop)) {
            continue;
        }
        existing.insert(nexthop);
        to_create.push_back(BuildStaticRoute(route_table, policy, ip_prefix,
                                             nexthop, bfd, external_ids));
    }

    ec = DetachStaticRoutes(router, to_delete, error_msg);
    if (ec) {
        return ec;
    }

    ec = CreateStaticRoutes(router, to_create, error_msg);
    if (ec) {
        PrependErrorContext("failed to add static routes to logical router " +
                            router, error_msg);
    }
    return ec;
}

error_code StaticRouteManager::UpdateStaticRoute(
    const StaticRoute *route, const Operation::ColumnList &columns,
    string *error_msg) const {
    if (route == NULL) {
        return SetError(kValidationError,
                        "the logical router static route is required",
                        error_msg);
    }
    if (route->uuid.empty()) {
        return SetError(kValidationError,
                        "the logical router static route has no uuid",
                        error_msg);
    }

    OperationList ops;
    StaticRouteOpBuilder::BuildUpdate(*route, columns, &ops);
    return executor_.Commit(kTxnUpdateRoute, ops,
        "update logical router static route 'policy " +
        route->EffectivePolicy() + " ip_prefix " + route->ip_prefix + "'",
        error_msg);
}

error_code StaticRouteManager::DetachStaticRoutes(const string &router,
                                                  const vector<string> &uuids,
                                                  string *error_msg) const {
    if (uuids.empty()) {
        return error_code();
    }
    OperationList ops;
    StaticRouteOpBuilder::BuildDelete(router, uuids, &ops);

    NB_ROUTE_LOG(INFO, router, "deleting static routes " <<
                 UuidListToString(uuids));
    return executor_.Commit(kTxnDeleteRoutes, ops,
        "delete static routes " + UuidListToString(uuids) +
        " from logical router " + router, error_msg);
}

error_code StaticRouteManager::DeleteStaticRoute(const string &router,
                                                 const string &route_table,
                                                 const string &policy,
                                                 const string &ip_prefix,
                                                 const string &nexthop,
                                                 string *error_msg) const {
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }

    LogicalRouter lr;
    bool found;
    ec = LookupRouter(router, true, &lr, &found, error_msg);
    if (ec || !found) {
        return ec;
    }

    StaticRouteFilter filter;
    filter.set_route_table(route_table).set_policy(policy)
        .set_ip_prefix(ip_prefix);
    if (!nexthop.empty()) {
        filter.set_nexthop(nexthop);
    }
    StaticRouteList routes;
    ec = ListByPredicate(router, filter, &routes, error_msg);
    if (ec) {
        // The router may have been deleted since it was read.
        if (ec == kNotFound) {
            return error_code();
        }
        PrependErrorContext("list static routes of logical router " + router,
                            error_msg);
        return ec;
    }

    return DetachStaticRoutes(router, RouteUuids(routes), error_msg);
}

error_code StaticRouteManager::DeleteStaticRouteByUuid(const string &router,
                                                       const string &uuid,
                                                       string *error_msg) const {
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }
    if (uuid.empty()) {
        return SetError(kValidationError, "the static route uuid is required",
                        error_msg);
    }

    LogicalRouter lr;
    bool found;
    ec = LookupRouter(router, true, &lr, &found, error_msg);
    if (ec || !found) {
        return ec;
    }

    return DetachStaticRoutes(router, vector<string>(1, uuid), error_msg);
}

error_code StaticRouteManager::DeleteStaticRoutesByExternalIds(
    const string &router, const StringMap &external_ids,
    string *error_msg) const {
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }

    LogicalRouter lr;
    bool found;
    ec = LookupRouter(router, true, &lr, &found, error_msg);
    if (ec || !found) {
        return ec;
    }

    StaticRouteFilter filter;
    filter.set_external_ids(external_ids);
    StaticRouteList routes;
    ec = ListByPredicate(router, filter, &routes, error_msg);
    if (ec) {
        if (ec == kNotFound) {
            return error_code();
        }
        PrependErrorContext("list static routes of logical router " + router,
                            error_msg);
        return ec;
    }

    return DetachStaticRoutes(router, RouteUuids(routes), error_msg);
}

error_code StaticRouteManager::BatchDeleteStaticRoutes(
    const string &router, const StaticRouteList &candidates,
    string *error_msg) const {
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }
    if (candidates.empty()) {
        return ec;
    }

    LogicalRouter lr;
    bool found;
    ec = LookupRouter(router, true, &lr, &found, error_msg);
    if (ec || !found) {
        return ec;
    }

    BatchDeleteMatcher::KeyNexthopMap requests;
    // A later candidate for the same key replaces an earlier one.
    BOOST_FOREACH(const StaticRoute &candidate, candidates) {
        requests[candidate.GetKey()] = candidate.nexthop;
    }

    // One store-wide scan restricted to this router's route set.
    StaticRouteList routes;
    string msg;
    ec = client_->ListStaticRoutes(BatchDeleteMatcher(lr, requests), &routes,
                                   &msg);
    if (ec) {
        return ClientError(ec, "list static routes of logical router " +
                           router, msg, error_msg);
    }

    return DetachStaticRoutes(router, RouteUuids(routes), error_msg);
}

error_code StaticRouteManager::ClearStaticRoutes(const string &router,
                                                 string *error_msg) const {
    error_code ec = ValidateRouterName(router, error_msg);
    if (ec) {
        return ec;
    }

    LogicalRouter lr;
    bool found;
    ec = LookupRouter(router, false, &lr, &found, error_msg);
    if (ec) {
        return ec;
    }

    OperationList ops;
    StaticRouteOpBuilder::BuildClear(router, &ops);
    NB_ROUTE_LOG(INFO, router, "clearing " << lr.static_routes.size()
                 << " static route(s)");
    return executor_.Commit(kTxnClearRoutes, ops,
        "clear logical router " + router + " static routes", error_msg);
}

}  // namespace NbRoute
