/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_STATIC_ROUTE_H_
#define SRC_NB_ROUTE_STATIC_ROUTE_H_

#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace NbRoute {

typedef std::map<std::string, std::string> StringMap;

// Static route policies understood by the northbound schema.
extern const std::string kPolicyDstIp;
extern const std::string kPolicySrcIp;

// Option set on routes created with a BFD reference; marks the route as a
// member of a BFD-gated ECMP group.
extern const std::string kOptionBfdEcmp;

// An unset policy reads as dst-ip.
const std::string &NormalizePolicy(const std::string &policy);

//
// (route_table, policy, ip_prefix) identifies an ECMP group within one
// logical router. The policy is stored normalized so that an unset policy
// and "dst-ip" compare equal.
//
struct StaticRouteKey {
    StaticRouteKey();
    StaticRouteKey(const std::string &route_table, const std::string &policy,
                   const std::string &ip_prefix);

    bool operator<(const StaticRouteKey &rhs) const;
    bool operator==(const StaticRouteKey &rhs) const;
    bool operator!=(const StaticRouteKey &rhs) const {
        return !operator==(rhs);
    }
    std::string ToString() const;

    std::string route_table;
    std::string policy;
    std::string ip_prefix;
};

//
// Snapshot of one Logical_Router_Static_Route row. Modifying a snapshot has
// no effect on the store until it is passed to an update operation.
//
struct StaticRoute {
    StaticRoute();

    StaticRouteKey GetKey() const;
    const std::string &EffectivePolicy() const {
        return NormalizePolicy(policy);
    }
    bool has_bfd() const { return bfd.is_initialized(); }
    std::string ToString() const;

    std::string uuid;
    std::string route_table;
    std::string policy;
    std::string ip_prefix;
    std::string nexthop;
    boost::optional<std::string> bfd;
    StringMap options;
    StringMap external_ids;
};

typedef std::vector<StaticRoute> StaticRouteList;

// Snapshot of the parts of a Logical_Router row this library touches.
struct LogicalRouter {
    typedef std::set<std::string> RouteUuidSet;

    bool HasStaticRoute(const std::string &uuid) const {
        return static_routes.find(uuid) != static_routes.end();
    }

    std::string uuid;
    std::string name;
    RouteUuidSet static_routes;
};

//
// External-id matching. An entry of filter with an empty value requires the
// key to be present with a non-empty value; a non-empty value requires an
// exact match. A route with fewer entries than the filter never matches.
//
bool ExternalIdsMatch(const StringMap &external_ids, const StringMap &filter);

std::string UuidListToString(const std::vector<std::string> &uuids);

}  // namespace NbRoute

#endif  // SRC_NB_ROUTE_STATIC_ROUTE_H_
