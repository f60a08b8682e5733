/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include "nb_route/static_route.h"

#include <sstream>
#include <boost/foreach.hpp>

#include "base/util.h"

using std::string;
using std::vector;

namespace NbRoute {

const string kPolicyDstIp("dst-ip");
const string kPolicySrcIp("src-ip");
const string kOptionBfdEcmp("ecmp_symmetric_reply");

const string &NormalizePolicy(const string &policy) {
    if (policy.empty()) {
        return kPolicyDstIp;
    }
    return policy;
}

StaticRouteKey::StaticRouteKey() : policy(kPolicyDstIp) {
}

StaticRouteKey::StaticRouteKey(const string &route_table,
                               const string &policy, const string &ip_prefix)
    : route_table(route_table), policy(NormalizePolicy(policy)),
      ip_prefix(ip_prefix) {
}

bool StaticRouteKey::operator<(const StaticRouteKey &rhs) const {
    BOOL_KEY_COMPARE(route_table, rhs.route_table);
    BOOL_KEY_COMPARE(policy, rhs.policy);
    BOOL_KEY_COMPARE(ip_prefix, rhs.ip_prefix);
    return false;
}

bool StaticRouteKey::operator==(const StaticRouteKey &rhs) const {
    return route_table == rhs.route_table && policy == rhs.policy &&
        ip_prefix == rhs.ip_prefix;
}

string StaticRouteKey::ToString() const {
    std::ostringstream out;
    out << "route_table '" << route_table << "' policy " << policy
        << " ip_prefix " << ip_prefix;
    return out.str();
}

StaticRoute::StaticRoute() {
}

StaticRouteKey StaticRoute::GetKey() const {
    return StaticRouteKey(route_table, policy, ip_prefix);
}

string StaticRoute::ToString() const {
    std::ostringstream out;
    out << GetKey().ToString() << " nexthop " << nexthop;
    if (has_bfd()) {
        out << " bfd " << *bfd;
    }
    if (!uuid.empty()) {
        out << " (" << uuid << ")";
    }
    return out.str();
}

bool ExternalIdsMatch(const StringMap &external_ids, const StringMap &filter) {
    if (external_ids.size() < filter.size()) {
        return false;
    }
    for (StringMap::const_iterator it = filter.begin(); it != filter.end();
         ++it) {
        StringMap::const_iterator found = external_ids.find(it->first);
        if (it->second.empty()) {
            // Key must exist with some value.
            if (found == external_ids.end() || found->second.empty()) {
                return false;
            }
        } else if (found == external_ids.end() ||
                   found->second != it->second) {
            return false;
        }
    }
    return true;
}

string UuidListToString(const vector<string> &uuids) {
    std::ostringstream out;
    out << "[";
    bool first = true;
    BOOST_FOREACH(const string &uuid, uuids) {
        if (!first) {
            out << " ";
        }
        out << uuid;
        first = false;
    }
    out << "]";
    return out.str();
}

}  // namespace NbRoute
