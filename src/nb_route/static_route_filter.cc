/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include "nb_route/static_route_filter.h"

#include <sstream>

using std::string;

namespace NbRoute {

StaticRouteFilter::StaticRouteFilter() {
}

StaticRouteFilter StaticRouteFilter::ForRoute(const string &route_table,
                                              const string &policy,
                                              const string &ip_prefix,
                                              const string &nexthop) {
    StaticRouteFilter filter;
    filter.set_route_table(route_table).set_policy(policy)
        .set_nexthop(nexthop);
    filter.ip_prefix_ = ip_prefix;
    return filter;
}

bool StaticRouteFilter::Match(const StaticRoute &route) const {
    if (!ExternalIdsMatch(route.external_ids, external_ids_)) {
        return false;
    }
    if (route_table_ && route.route_table != *route_table_) {
        return false;
    }
    if (policy_ && route.EffectivePolicy() != *policy_) {
        return false;
    }
    if (ip_prefix_ && route.ip_prefix != *ip_prefix_) {
        return false;
    }
    if (nexthop_ && route.nexthop != *nexthop_) {
        return false;
    }
    if (option_) {
        StringMap::const_iterator it = route.options.find(option_->first);
        if (it == route.options.end() || it->second != option_->second) {
            return false;
        }
    }
    return true;
}

string StaticRouteFilter::ToString() const {
    std::ostringstream out;
    if (route_table_) {
        out << "route_table '" << *route_table_ << "' ";
    }
    if (policy_) {
        out << "policy " << *policy_ << " ";
    }
    if (ip_prefix_) {
        out << "ip_prefix " << *ip_prefix_ << " ";
    }
    if (nexthop_) {
        out << "nexthop " << *nexthop_ << " ";
    }
    for (StringMap::const_iterator it = external_ids_.begin();
         it != external_ids_.end(); ++it) {
        out << "external_ids:" << it->first << "=" << it->second << " ";
    }
    if (option_) {
        out << "options:" << option_->first << "=" << option_->second << " ";
    }
    string result = out.str();
    if (!result.empty()) {
        result.erase(result.size() - 1);
    }
    return result;
}

}  // namespace NbRoute
