/*
 * Copyright (c) 2013 Juniper Networks, Inc. All rights reserved.
 */

/*
 * C++ language helpers shared by the nb_route library and its tests.
 * DO NOT add anything here that can be thought of as a library or that
 * requires the inclusion of other header files.
 */
#ifndef __UTIL_H__
#define __UTIL_H__

#define DISALLOW_COPY_AND_ASSIGN(_Class) \
    _Class(const _Class &);              \
    _Class& operator=(const _Class &)

// Lexicographic step of an operator< over several fields.
#define BOOL_KEY_COMPARE(x, y) \
    do { \
        if ((x) < (y)) return true; \
        if ((y) < (x)) return false; \
    } while (0)

// Check if key exist in collection
template <typename Collection, typename T>
bool STLKeyExists(const Collection &col, const T &key) {
    return col.find(key) != col.end();
}

#endif /* __UTIL_H__ */
