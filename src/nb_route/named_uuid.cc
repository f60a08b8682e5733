/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include "nb_route/named_uuid.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/random_generator.hpp>

using std::string;

namespace NbRoute {

static const char kNamedUuidPrefix[] = "row_";
static const size_t kNamedUuidPrefixLen = sizeof(kNamedUuidPrefix) - 1;

string GenerateNamedUuid() {
    static const char kHexDigits[] = "0123456789abcdef";
    boost::uuids::random_generator gen;
    boost::uuids::uuid u = gen();

    string name(kNamedUuidPrefix);
    name.reserve(kNamedUuidPrefixLen + 2 * u.size());
    for (boost::uuids::uuid::const_iterator it = u.begin(); it != u.end();
         ++it) {
        name.push_back(kHexDigits[(*it >> 4) & 0x0F]);
        name.push_back(kHexDigits[*it & 0x0F]);
    }
    return name;
}

bool IsNamedUuid(const string &uuid) {
    if (uuid.size() != kNamedUuidPrefixLen + 32) {
        return false;
    }
    if (uuid.compare(0, kNamedUuidPrefixLen, kNamedUuidPrefix) != 0) {
        return false;
    }
    return uuid.find_first_not_of("0123456789abcdef", kNamedUuidPrefixLen) ==
        string::npos;
}

}  // namespace NbRoute
