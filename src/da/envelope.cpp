// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file envelope.cpp
 * @brief Implementation of DA envelope extraction
 */

#include <da/envelope.h>

#include <util.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace da {

bool ParseMagic(const std::string& str, DaMagic& magicOut)
{
    if (str.size() == 2 * DA_MAGIC_SIZE && IsHex(str)) {
        std::vector<unsigned char> bytes = ParseHex(str);
        std::copy(bytes.begin(), bytes.end(), magicOut.begin());
        return true;
    }
    if (str.size() == DA_MAGIC_SIZE) {
        std::copy(str.begin(), str.end(), magicOut.begin());
        return true;
    }
    return false;
}

std::string MagicToString(const DaMagic& magic)
{
    return HexStr(magic.begin(), magic.end());
}

// ============================================================================
// DaEnvelope Implementation
// ============================================================================

std::vector<unsigned char> DaEnvelope::GetChunkBody() const
{
    if (payload.size() <= DA_CHUNK_HEADER_SIZE) {
        return {};
    }
    return std::vector<unsigned char>(payload.begin() + DA_CHUNK_HEADER_SIZE, payload.end());
}

size_t DaEnvelope::GetChunkBodySize() const
{
    return payload.size() > DA_CHUNK_HEADER_SIZE ? payload.size() - DA_CHUNK_HEADER_SIZE : 0;
}

std::string DaEnvelope::ToString() const
{
    return strprintf("DaEnvelope(txid=%s, wtxid=%s, height=%d, blob=%s, chunk=%u/%u, body=%u, prev=%s)",
                     txid.ToString().substr(0, 16), wtxid.ToString().substr(0, 16), nHeight,
                     blobHash.ToString().substr(0, 16), chunkIndex, totalChunks,
                     GetChunkBodySize(), prevTailWtxid.ToString().substr(0, 16));
}

// ============================================================================
// EnvelopeExtractor Implementation
// ============================================================================

std::optional<DaEnvelope> EnvelopeExtractor::Extract(const CTransaction& tx, int nHeight) const
{
    uint256 prevTail;
    LinkingTagStatus tag = FindLinkingTag(tx, prevTail);
    if (tag == LinkingTagStatus::ABSENT) {
        return std::nullopt;
    }
    if (tag == LinkingTagStatus::MALFORMED) {
        LogPrint(BCLog::DA, "EnvelopeExtractor: %s at height %d has a truncated linking tag, skipping\n",
                 tx.GetHash().ToString(), nHeight);
        return std::nullopt;
    }

    std::optional<std::vector<unsigned char>> payload = FindWitnessPayload(tx);
    if (!payload) {
        LogPrint(BCLog::DA, "EnvelopeExtractor: %s at height %d is tagged but carries no envelope, skipping\n",
                 tx.GetHash().ToString(), nHeight);
        return std::nullopt;
    }

    DaChunkHeader header;
    ChunkFormatError error;
    if (!DaChunkHeader::Parse(*payload, header, &error)) {
        LogPrint(BCLog::DA, "EnvelopeExtractor: %s at height %d has a bad chunk header (%s), skipping\n",
                 tx.GetHash().ToString(), nHeight, ChunkFormatErrorString(error));
        return std::nullopt;
    }

    DaEnvelope env;
    env.txid = tx.GetHash();
    env.wtxid = tx.GetWitnessHash();
    env.nHeight = nHeight;
    env.blobHash = header.blobHash;
    env.chunkIndex = header.chunkIndex;
    env.totalChunks = header.totalChunks;
    env.payload = std::move(*payload);
    env.prevTailWtxid = prevTail;

    LogPrint(BCLog::DA, "EnvelopeExtractor: found %s\n", env.ToString());
    return env;
}

LinkingTagStatus EnvelopeExtractor::FindLinkingTag(const CTransaction& tx, uint256& prevTailWtxid) const
{
    LinkingTagStatus status = LinkingTagStatus::ABSENT;
    for (const auto& output : tx.vout) {
        std::vector<unsigned char> data = ExtractPushData(output.scriptPubKey);
        if (data.size() < DA_MAGIC_SIZE) {
            continue;
        }
        if (memcmp(data.data(), m_magic.data(), DA_MAGIC_SIZE) != 0) {
            continue;
        }

        if (data.size() == DA_MAGIC_SIZE) {
            // Only the very first DA transaction may omit the back-reference
            prevTailWtxid.SetNull();
            return LinkingTagStatus::FOUND;
        }
        if (data.size() < LINKING_TAG_DATA_SIZE) {
            // A later output may still carry a well-formed tag
            status = LinkingTagStatus::MALFORMED;
            continue;
        }
        prevTailWtxid = uint256(std::vector<unsigned char>(data.begin() + DA_MAGIC_SIZE,
                                                           data.begin() + LINKING_TAG_DATA_SIZE));
        return LinkingTagStatus::FOUND;
    }
    return status;
}

std::vector<unsigned char> EnvelopeExtractor::ExtractPushData(const CScript& script)
{
    if (script.empty() || script[0] != OP_RETURN) {
        return {};
    }

    CScript::const_iterator pc = script.begin() + 1;
    opcodetype opcode;
    std::vector<unsigned char> push;
    std::vector<unsigned char> data;

    while (pc < script.end()) {
        if (!script.GetOp(pc, opcode, push)) {
            break;
        }
        if (opcode > OP_PUSHDATA4) {
            break;
        }
        data.insert(data.end(), push.begin(), push.end());
    }
    return data;
}

std::optional<std::vector<unsigned char>> EnvelopeExtractor::ExtractEnvelopePayload(const CScript& tapscript)
{
    CScript::const_iterator pc = tapscript.begin();
    opcodetype opcode;
    opcodetype prevOpcode = OP_INVALIDOPCODE;
    std::vector<unsigned char> push;

    // Find OP_FALSE OP_IF
    bool fOpened = false;
    while (pc < tapscript.end()) {
        if (!tapscript.GetOp(pc, opcode, push)) {
            return std::nullopt;
        }
        if (prevOpcode == OP_FALSE && opcode == OP_IF) {
            fOpened = true;
            break;
        }
        prevOpcode = opcode;
    }
    if (!fOpened) {
        return std::nullopt;
    }

    std::vector<unsigned char> payload;
    while (pc < tapscript.end()) {
        if (!tapscript.GetOp(pc, opcode, push)) {
            return std::nullopt;
        }
        if (opcode == OP_ENDIF) {
            if (payload.empty()) {
                return std::nullopt;
            }
            return payload;
        }
        if (opcode <= OP_PUSHDATA4) {
            payload.insert(payload.end(), push.begin(), push.end());
        }
    }

    // Unterminated envelope
    return std::nullopt;
}

std::optional<std::vector<unsigned char>> EnvelopeExtractor::FindWitnessPayload(const CTransaction& tx)
{
    for (const auto& input : tx.vin) {
        const auto& stack = input.scriptWitness.stack;
        if (stack.size() < 2) {
            continue;
        }
        CScript tapscript(stack[1].begin(), stack[1].end());
        std::optional<std::vector<unsigned char>> payload = ExtractEnvelopePayload(tapscript);
        if (payload) {
            return payload;
        }
    }
    return std::nullopt;
}

CScript EnvelopeExtractor::CreateLinkingTagScript(const DaMagic& magic, const uint256& prevTailWtxid)
{
    CScript script;
    script << OP_RETURN << std::vector<unsigned char>(magic.begin(), magic.end()) << ToByteVector(prevTailWtxid);
    return script;
}

CScript EnvelopeExtractor::CreateEnvelopeScript(const std::vector<unsigned char>& xonlyPubKey,
                                                const std::vector<unsigned char>& chunk)
{
    CScript script;
    script << xonlyPubKey << OP_CHECKSIG << OP_FALSE << OP_IF;
    for (size_t offset = 0; offset < chunk.size(); offset += MAX_SCRIPT_ELEMENT_SIZE) {
        size_t len = std::min<size_t>(MAX_SCRIPT_ELEMENT_SIZE, chunk.size() - offset);
        script << std::vector<unsigned char>(chunk.begin() + offset, chunk.begin() + offset + len);
    }
    script << OP_ENDIF;
    return script;
}

} // namespace da
