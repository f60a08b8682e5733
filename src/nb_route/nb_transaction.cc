/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#include "nb_route/nb_transaction.h"

#include <boost/foreach.hpp>

#include "nb_route/nb_client.h"
#include "nb_route/nb_error.h"
#include "nb_route/nb_route_log.h"

using boost::system::error_code;
using std::string;

namespace NbRoute {

TransactionExecutor::TransactionExecutor(NbClient *client) : client_(client) {
}

error_code TransactionExecutor::Commit(const string &name,
                                       const OperationList &ops,
                                       const string &context,
                                       string *error_msg) const {
    if (ops.empty()) {
        return error_code();
    }

    NB_ROUTE_TXN_LOG(DEBUG, name, context << ", " << ops.size()
                     << " operation(s)");
    BOOST_FOREACH(const Operation &op, ops) {
        NB_ROUTE_TXN_LOG(TRACE, name, op.ToString());
    }

    string store_msg;
    error_code ec = client_->Transact(name, ops, &store_msg);
    if (!ec) {
        return ec;
    }

    string msg = context + ": " +
        (store_msg.empty() ? ec.message() : store_msg);
    NB_ROUTE_TXN_LOG(ERROR, name, msg);
    return SetError(kTransactionError, msg, error_msg);
}

}  // namespace NbRoute
