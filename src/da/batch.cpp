// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <da/batch.h>

#include <crypto/common.h>
#include <da/reassembly.h>
#include <util.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace da {

bool EvmHeaderDigest::operator==(const EvmHeaderDigest& other) const
{
    return nBlockNum == other.nBlockNum &&
           nTimestamp == other.nTimestamp &&
           nBaseFee == other.nBaseFee &&
           nGasUsed == other.nGasUsed &&
           nGasLimit == other.nGasLimit;
}

std::vector<unsigned char> BatchRecord::Serialize() const
{
    std::vector<unsigned char> out(BATCH_RECORD_PREFIX_SIZE);
    std::copy(batchIdPrevBlock.begin(), batchIdPrevBlock.end(), out.begin());
    std::copy(batchIdLastBlock.begin(), batchIdLastBlock.end(), out.begin() + 32);
    WriteBE64(&out[64], evmHeader.nBlockNum);
    WriteBE64(&out[72], evmHeader.nTimestamp);
    WriteBE64(&out[80], evmHeader.nBaseFee);
    WriteBE64(&out[88], evmHeader.nGasUsed);
    WriteBE64(&out[96], evmHeader.nGasLimit);
    out.insert(out.end(), stateDiff.begin(), stateDiff.end());
    return out;
}

std::string BatchRecord::ToString() const
{
    std::ostringstream ss;
    ss << "BatchRecord("
       << "prev_block=" << HexStr(batchIdPrevBlock.begin(), batchIdPrevBlock.end()).substr(0, 16)
       << ", last_block=" << HexStr(batchIdLastBlock.begin(), batchIdLastBlock.end()).substr(0, 16)
       << ", block_num=" << evmHeader.nBlockNum
       << ", timestamp=" << evmHeader.nTimestamp
       << ", base_fee=" << evmHeader.nBaseFee
       << ", gas_used=" << evmHeader.nGasUsed
       << ", gas_limit=" << evmHeader.nGasLimit
       << ", state_diff=" << stateDiff.size() << " bytes"
       << (IsEmptyBatch() ? ", empty" : "")
       << ")";
    return ss.str();
}

bool BatchRecord::operator==(const BatchRecord& other) const
{
    return batchIdPrevBlock == other.batchIdPrevBlock &&
           batchIdLastBlock == other.batchIdLastBlock &&
           evmHeader == other.evmHeader &&
           stateDiff == other.stateDiff;
}

std::string BatchDecodeErrorString(BatchDecodeError error)
{
    switch (error) {
    case BatchDecodeError::NONE: return "ok";
    case BatchDecodeError::TRUNCATED: return "blob shorter than batch record prefix";
    }
    return "unknown";
}

bool DecodeBatchRecord(const std::vector<unsigned char>& data, BatchRecord& record, BatchDecodeError* error)
{
    if (data.size() < BATCH_RECORD_PREFIX_SIZE) {
        if (error) *error = BatchDecodeError::TRUNCATED;
        return false;
    }

    BatchRecord decoded;
    decoded.batchIdPrevBlock = uint256(std::vector<unsigned char>(data.begin(), data.begin() + 32));
    decoded.batchIdLastBlock = uint256(std::vector<unsigned char>(data.begin() + 32, data.begin() + 64));
    decoded.evmHeader.nBlockNum = ReadBE64(&data[64]);
    decoded.evmHeader.nTimestamp = ReadBE64(&data[72]);
    decoded.evmHeader.nBaseFee = ReadBE64(&data[80]);
    decoded.evmHeader.nGasUsed = ReadBE64(&data[88]);
    decoded.evmHeader.nGasLimit = ReadBE64(&data[96]);
    decoded.stateDiff.assign(data.begin() + BATCH_RECORD_PREFIX_SIZE, data.end());

    if (error) *error = BatchDecodeError::NONE;
    record = std::move(decoded);
    return true;
}

bool DecodeBatchRecord(const Blob& blob, BatchRecord& record, BatchDecodeError* error)
{
    BatchDecodeError err;
    if (!DecodeBatchRecord(blob.data, record, &err)) {
        LogPrint(BCLog::DA, "DecodeBatchRecord: blob %s (%u bytes): %s\n",
                 blob.blobHash.ToString(), blob.data.size(), BatchDecodeErrorString(err));
        if (error) *error = err;
        return false;
    }
    if (error) *error = BatchDecodeError::NONE;
    return true;
}

bool CheckBatchProgression(const std::vector<BatchRecord>& batches, std::vector<std::string>& messages)
{
    bool fValid = true;
    for (size_t i = 1; i < batches.size(); ++i) {
        const uint64_t nPrev = batches[i - 1].GetLastBlockNum();
        const uint64_t nCur = batches[i].GetLastBlockNum();
        if (nCur > nPrev) {
            messages.push_back(strprintf("OK: Batch %u last_block_num %u > %u", i, nCur, nPrev));
        } else {
            messages.push_back(strprintf("FAIL: Batch %u last_block_num %u does not advance past %u", i, nCur, nPrev));
            fValid = false;
        }
    }
    return fValid;
}

} // namespace da
