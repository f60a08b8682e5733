/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_NB_TRANSACTION_H_
#define SRC_NB_ROUTE_NB_TRANSACTION_H_

#include <string>

#include <boost/system/error_code.hpp>

#include "base/util.h"
#include "nb_route/nb_operation.h"

namespace NbRoute {

class NbClient;

//
// Commits operation lists as named, atomic transactions. Store failures are
// reported as kTransactionError with the caller's context (purpose and the
// keys involved) prepended to the store's message. Nothing is retried here;
// the reconciliation loop above us owns retry and backoff.
//
class TransactionExecutor {
public:
    explicit TransactionExecutor(NbClient *client);

    // An empty ops list succeeds without contacting the store.
    boost::system::error_code Commit(const std::string &name,
                                     const OperationList &ops,
                                     const std::string &context,
                                     std::string *error_msg) const;

private:
    NbClient *client_;

    DISALLOW_COPY_AND_ASSIGN(TransactionExecutor);
};

}  // namespace NbRoute

#endif  // SRC_NB_ROUTE_NB_TRANSACTION_H_
