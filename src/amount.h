// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_AMOUNT_H
#define DACHECK_AMOUNT_H

#include <stdint.h>

/** Amount in satoshis (Can be negative) */
typedef int64_t CAmount;

static const CAmount COIN = 100000000;

#endif //  DACHECK_AMOUNT_H
