/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_NAMED_UUID_H_
#define SRC_NB_ROUTE_NAMED_UUID_H_

#include <string>

namespace NbRoute {

//
// Returns a fresh request-scoped row name ("row_" followed by 32 hex digits)
// usable as an OVSDB named-uuid. A named uuid lets one transaction insert a
// row and reference it before the store assigns the real uuid. Every call
// draws from its own generator; there is no shared counter or lock.
//
std::string GenerateNamedUuid();

// True if uuid has the form produced by GenerateNamedUuid().
bool IsNamedUuid(const std::string &uuid);

}  // namespace NbRoute

#endif  // SRC_NB_ROUTE_NAMED_UUID_H_
