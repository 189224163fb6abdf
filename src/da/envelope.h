// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_DA_ENVELOPE_H
#define DACHECK_DA_ENVELOPE_H

/**
 * @file envelope.h
 * @brief Extraction of DA envelopes from base-chain reveal transactions
 *
 * A DA reveal transaction carries one chunk. It has:
 *
 * - a linking tag output:
 *     OP_RETURN <magic:4 bytes> <prev_tail_wtxid:32 bytes>
 *   where prev_tail_wtxid is the wtxid (internal byte order) of the DA
 *   transaction posted immediately before it, or all zeroes for the very
 *   first one;
 *
 * - a taproot script-path input whose second witness element is the
 *   tapscript
 *     <xonly pubkey> OP_CHECKSIG OP_FALSE OP_IF <push>... OP_ENDIF
 *   with the pushes concatenating to the chunk payload (header ++ body).
 */

#include <da/chunk_header.h>
#include <primitives/transaction.h>
#include <script/script.h>
#include <uint256.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace da {

/** Size of the protocol magic that prefixes the linking tag */
static constexpr size_t DA_MAGIC_SIZE = 4;

/** Size of the linking tag data: magic + back-reference */
static constexpr size_t LINKING_TAG_DATA_SIZE = DA_MAGIC_SIZE + 32;

typedef std::array<unsigned char, DA_MAGIC_SIZE> DaMagic;

/**
 * Parse a magic given either as 8 hex digits or as 4 ASCII characters.
 * @return false if the string is neither
 */
bool ParseMagic(const std::string& str, DaMagic& magicOut);

std::string MagicToString(const DaMagic& magic);

/**
 * @brief One base-chain transaction carrying one chunk of a DA blob
 *
 * Built once per scanned transaction by EnvelopeExtractor and not modified
 * afterwards.
 */
struct DaEnvelope {
    /** Transaction id */
    uint256 txid;

    /** Witness transaction id; the unit of the back-reference chain */
    uint256 wtxid;

    /** Base-chain height the transaction was included at */
    int nHeight;

    /** Copied from the chunk header */
    uint256 blobHash;
    uint16_t chunkIndex;
    uint16_t totalChunks;

    /** Full chunk payload: header followed by the chunk body */
    std::vector<unsigned char> payload;

    /** Back-reference from the linking tag; null for the first DA transaction */
    uint256 prevTailWtxid;

    DaEnvelope() : nHeight(0), chunkIndex(0), totalChunks(0) {}

    bool IsFirstChunk() const { return chunkIndex == 0; }
    bool IsLastChunk() const { return totalChunks > 0 && chunkIndex == totalChunks - 1; }

    /** Chunk body, i.e. the payload without its header */
    std::vector<unsigned char> GetChunkBody() const;
    size_t GetChunkBodySize() const;

    std::string ToString() const;
};

/** Outcome of looking for a linking tag among a transaction's outputs */
enum class LinkingTagStatus {
    ABSENT,     //!< no OP_RETURN output starts with the magic
    FOUND,      //!< tag found, back-reference extracted (or defaulted to zero)
    MALFORMED,  //!< magic matched but every such back-reference is truncated
};

/**
 * @brief Turns raw transactions into DaEnvelopes
 *
 * Stateless apart from the configured magic; safe to share between threads.
 */
class EnvelopeExtractor {
public:
    explicit EnvelopeExtractor(const DaMagic& magic) : m_magic(magic) {}

    const DaMagic& GetMagic() const { return m_magic; }

    /**
     * @brief Extract the DA envelope carried by a transaction
     * @param tx Transaction including witness data
     * @param nHeight Height of the block that included it
     * @return the envelope, or std::nullopt if the transaction is not a
     *         well-formed DA reveal (unrelated transactions are the common case)
     */
    std::optional<DaEnvelope> Extract(const CTransaction& tx, int nHeight) const;

    /**
     * @brief Locate the linking tag output
     *
     * The first output whose tag is well formed wins. Truncated tags are
     * passed over and only reported when no output is well formed.
     * @param[out] prevTailWtxid Back-reference, set to zero when the tag carries only the magic
     */
    LinkingTagStatus FindLinkingTag(const CTransaction& tx, uint256& prevTailWtxid) const;

    /**
     * Concatenate the data pushes that follow OP_RETURN. Returns an empty
     * vector if the script is not an OP_RETURN script. Parsing stops at the
     * first non-push opcode or truncated push.
     */
    static std::vector<unsigned char> ExtractPushData(const CScript& script);

    /**
     * Concatenate the pushes between OP_FALSE OP_IF and OP_ENDIF.
     * @return std::nullopt if there is no complete envelope or it is empty
     */
    static std::optional<std::vector<unsigned char>> ExtractEnvelopePayload(const CScript& tapscript);

    /** Envelope payload from the first input whose second witness element holds one */
    static std::optional<std::vector<unsigned char>> FindWitnessPayload(const CTransaction& tx);

    /** OP_RETURN <magic> <prevTailWtxid> */
    static CScript CreateLinkingTagScript(const DaMagic& magic, const uint256& prevTailWtxid);

    /**
     * <xonlyPubKey> OP_CHECKSIG OP_FALSE OP_IF <chunk in 520-byte pushes> OP_ENDIF
     */
    static CScript CreateEnvelopeScript(const std::vector<unsigned char>& xonlyPubKey,
                                        const std::vector<unsigned char>& chunk);

private:
    DaMagic m_magic;
};

} // namespace da

#endif // DACHECK_DA_ENVELOPE_H
