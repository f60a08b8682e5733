/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_NB_ERROR_H_
#define SRC_NB_ROUTE_NB_ERROR_H_

#include <string>
#include <boost/system/error_code.hpp>

namespace NbRoute {

//
// Error taxonomy of the static route client. Codes are carried in a
// boost::system::error_code of the nb_route category; the descriptive text
// (operation, router, keys) travels separately through an error_msg string.
//
enum ErrorCode {
    kOk = 0,
    kValidationError,
    kNotFound,
    kIntegrityError,
    kTransactionError,
    kTimeout,
};

class NbErrorCategory : public boost::system::error_category {
public:
    virtual const char *name() const BOOST_NOEXCEPT { return "nb_route"; }
    virtual std::string message(int ev) const;
};

const boost::system::error_category &nb_error_category();

boost::system::error_code make_error_code(ErrorCode code);

//
// Fill error_msg (if the caller asked for one) and return the matching code.
//
boost::system::error_code SetError(ErrorCode code, const std::string &msg,
                                   std::string *error_msg);

//
// Prepend context to an error produced by a lower layer:
// "<context>: <inner message>".
//
void PrependErrorContext(const std::string &context, std::string *error_msg);

}  // namespace NbRoute

namespace boost {
namespace system {

template <>
struct is_error_code_enum<NbRoute::ErrorCode> {
    static const bool value = true;
};

}  // namespace system
}  // namespace boost

#endif  // SRC_NB_ROUTE_NB_ERROR_H_
