/*
 * Copyright (c) 2017 Juniper Networks, Inc. All rights reserved.
 */

#ifndef SRC_NB_ROUTE_NB_ROUTE_LOG_H_
#define SRC_NB_ROUTE_NB_ROUTE_LOG_H_

#include "base/logging.h"

#define NB_ROUTE_LOG(_Level, _Router, _Msg)                          \
    LOG(_Level, "NbRoute: logical router " << (_Router) << ": " << _Msg)

#define NB_ROUTE_TXN_LOG(_Level, _Txn, _Msg)                         \
    LOG(_Level, "NbRoute: transaction " << (_Txn) << ": " << _Msg)

#endif  // SRC_NB_ROUTE_NB_ROUTE_LOG_H_
