/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_STATIC_ROUTE_FILTER_H_
#define SRC_NB_ROUTE_STATIC_ROUTE_FILTER_H_

#include <string>
#include <utility>

#include <boost/function.hpp>
#include <boost/optional.hpp>

#include "nb_route/static_route.h"

namespace NbRoute {

typedef boost::function<bool(const StaticRoute &)> StaticRoutePredicate;

//
// Conjunction of optional constraints on a static route. Unset constraints
// match anything. The filter is a value type and can be handed to the store
// as a StaticRoutePredicate.
//
class StaticRouteFilter {
public:
    StaticRouteFilter();

    // Exact lookup on the full (table, policy, prefix, nexthop) identity.
    // Every field, an empty prefix included, must match.
    static StaticRouteFilter ForRoute(const std::string &route_table,
                                      const std::string &policy,
                                      const std::string &ip_prefix,
                                      const std::string &nexthop);

    StaticRouteFilter &set_route_table(const std::string &route_table) {
        route_table_ = route_table;
        return *this;
    }

    // A route with an unset policy matches only dst-ip.
    StaticRouteFilter &set_policy(const std::string &policy) {
        policy_ = NormalizePolicy(policy);
        return *this;
    }

    // Empty prefix does not constrain.
    StaticRouteFilter &set_ip_prefix(const std::string &ip_prefix) {
        if (ip_prefix.empty()) {
            ip_prefix_ = boost::none;
        } else {
            ip_prefix_ = ip_prefix;
        }
        return *this;
    }

    StaticRouteFilter &set_nexthop(const std::string &nexthop) {
        nexthop_ = nexthop;
        return *this;
    }

    StaticRouteFilter &set_external_ids(const StringMap &external_ids) {
        external_ids_ = external_ids;
        return *this;
    }

    StaticRouteFilter &set_option(const std::string &key,
                                  const std::string &value) {
        option_ = std::make_pair(key, value);
        return *this;
    }

    bool Match(const StaticRoute &route) const;
    bool operator()(const StaticRoute &route) const { return Match(route); }

    std::string ToString() const;

private:
    boost::optional<std::string> route_table_;
    boost::optional<std::string> policy_;
    boost::optional<std::string> ip_prefix_;
    boost::optional<std::string> nexthop_;
    StringMap external_ids_;
    boost::optional<std::pair<std::string, std::string> > option_;
};

}  // namespace NbRoute

#endif  // SRC_NB_ROUTE_STATIC_ROUTE_FILTER_H_
