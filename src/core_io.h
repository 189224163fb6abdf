// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_CORE_IO_H
#define DACHECK_CORE_IO_H

#include <string>
#include <vector>

class CScript;
class CTransaction;
struct CMutableTransaction;

// core_read.cpp
bool DecodeHexTx(CMutableTransaction& tx, const std::string& hex_tx, bool try_no_witness = false, bool try_witness = true);

// core_write.cpp
std::string FormatScript(const CScript& script);
std::string EncodeHexTx(const CTransaction& tx, const int serializeFlags = 0);

#endif // DACHECK_CORE_IO_H
