/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include "nb_route/nb_error.h"

using std::string;

namespace NbRoute {

string NbErrorCategory::message(int ev) const {
    switch (ev) {
    case kOk:
        return "success";
    case kValidationError:
        return "validation error";
    case kNotFound:
        return "not found";
    case kIntegrityError:
        return "data integrity violation";
    case kTransactionError:
        return "transaction failed";
    case kTimeout:
        return "request timed out";
    default:
        break;
    }
    return "unknown error";
}

const boost::system::error_category &nb_error_category() {
    static const NbErrorCategory category;
    return category;
}

boost::system::error_code make_error_code(ErrorCode code) {
    return boost::system::error_code(static_cast<int>(code),
                                     nb_error_category());
}

boost::system::error_code SetError(ErrorCode code, const string &msg,
                                   string *error_msg) {
    if (error_msg) {
        *error_msg = msg;
    }
    return make_error_code(code);
}

void PrependErrorContext(const string &context, string *error_msg) {
    if (!error_msg) {
        return;
    }
    if (error_msg->empty()) {
        *error_msg = context;
    } else {
        *error_msg = context + ": " + *error_msg;
    }
}

}  // namespace NbRoute
