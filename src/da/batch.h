// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_DA_BATCH_H
#define DACHECK_DA_BATCH_H

/**
 * @file batch.h
 * @brief Decoding of reassembled DA blobs into batch records
 *
 * A blob encodes one rollup batch:
 *
 *   offset  size  field
 *   0       32    batch_id.prev_block   (EVM block hash, raw bytes)
 *   32      32    batch_id.last_block   (EVM block hash, raw bytes)
 *   64      40    EVM header digest     (5 x u64, big-endian)
 *   104     rest  state diff            (opaque)
 */

#include <uint256.h>

#include <cstdint>
#include <string>
#include <vector>

namespace da {

struct Blob;

/**
 * A state diff at most this long encodes "no changes". An empty diff still
 * carries its own framing, so the bound is not zero.
 */
static constexpr size_t EMPTY_STATE_DIFF_MAX_SIZE = 12;

/** Serialized size of an EvmHeaderDigest */
static constexpr size_t EVM_HEADER_DIGEST_SIZE = 40;

/** Size of the fixed part of a batch record that precedes the state diff */
static constexpr size_t BATCH_RECORD_PREFIX_SIZE = 32 + 32 + EVM_HEADER_DIGEST_SIZE;

/** Summary of the last EVM block header covered by a batch */
struct EvmHeaderDigest {
    uint64_t nBlockNum;
    uint64_t nTimestamp;
    uint64_t nBaseFee;
    uint64_t nGasUsed;
    uint64_t nGasLimit;

    EvmHeaderDigest() : nBlockNum(0), nTimestamp(0), nBaseFee(0), nGasUsed(0), nGasLimit(0) {}

    bool operator==(const EvmHeaderDigest& other) const;
    bool operator!=(const EvmHeaderDigest& other) const { return !(*this == other); }
};

/** One decoded rollup batch */
struct BatchRecord {
    /** Hash of the EVM block preceding the batch */
    uint256 batchIdPrevBlock;

    /** Hash of the last EVM block in the batch */
    uint256 batchIdLastBlock;

    EvmHeaderDigest evmHeader;

    /** Opaque state diff */
    std::vector<unsigned char> stateDiff;

    /** Number of the last EVM block in the batch */
    uint64_t GetLastBlockNum() const { return evmHeader.nBlockNum; }

    /** True when the batch changes no state */
    bool IsEmptyBatch() const { return stateDiff.size() <= EMPTY_STATE_DIFF_MAX_SIZE; }

    /** Encode to the blob layout; inverse of DecodeBatchRecord */
    std::vector<unsigned char> Serialize() const;

    std::string ToString() const;

    bool operator==(const BatchRecord& other) const;
};

enum class BatchDecodeError {
    NONE,
    TRUNCATED,  //!< blob shorter than BATCH_RECORD_PREFIX_SIZE
};

std::string BatchDecodeErrorString(BatchDecodeError error);

/**
 * @brief Decode a batch record from blob bytes
 * @param[out] record Decoded record, only written on success
 * @param[out] error Reason for rejection, may be null
 * @return true on success
 */
bool DecodeBatchRecord(const std::vector<unsigned char>& data, BatchRecord& record,
                       BatchDecodeError* error = nullptr);

/** Decode the batch carried by a reassembled blob */
bool DecodeBatchRecord(const Blob& blob, BatchRecord& record, BatchDecodeError* error = nullptr);

/**
 * @brief Check that last_block_num strictly increases across consecutive batches
 * @param batches Batches in posting order
 * @param[out] messages OK:/FAIL: lines, one per consecutive pair
 * @return true if every batch advances past its predecessor
 */
bool CheckBatchProgression(const std::vector<BatchRecord>& batches, std::vector<std::string>& messages);

} // namespace da

#endif // DACHECK_DA_BATCH_H
