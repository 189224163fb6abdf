// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_DA_CHAIN_VALIDATOR_H
#define DACHECK_DA_CHAIN_VALIDATOR_H

/**
 * @file chain_validator.h
 * @brief Verification of the wtxid back-reference chain of DA transactions
 *
 * Every DA transaction names, in its linking tag, the wtxid it builds on:
 * - chunk 0 of a blob references the last chunk of the blob posted before
 *   it (or zero for the very first DA transaction);
 * - chunk k > 0 references chunk k-1 of the same blob.
 *
 * The validator walks an envelope sequence in scan order and reports every
 * link that does not hold. Chunks that arrive before their intra-blob
 * predecessor are held back until it shows up, so a blob spread over
 * several blocks in any order is still checked link by link.
 */

#include <da/envelope.h>
#include <uint256.h>

#include <cstdint>
#include <string>
#include <vector>

namespace da {

// ============================================================================
// Diagnostics
// ============================================================================

enum class ChainDiagnosticKind {
    BROKEN_LINK,             //!< chunk 0 does not reference the previous blob's tail
    BROKEN_INTRA_BLOB_LINK,  //!< chunk k does not reference chunk k-1
    DUPLICATE_CHUNK,         //!< second carrier for an already seen (blob, index)
    INCOMPLETE_BLOB,         //!< blob still in progress at end of input
};

std::string ChainDiagnosticKindString(ChainDiagnosticKind kind);

/** One finding about one envelope */
struct ChainDiagnostic {
    ChainDiagnosticKind kind;

    uint256 txid;
    uint256 wtxid;
    int nHeight;
    uint256 blobHash;
    uint16_t chunkIndex;

    /** Back-reference the envelope should carry (null when not applicable) */
    uint256 expected;

    /** Back-reference the envelope does carry */
    uint256 actual;

    ChainDiagnostic() : kind(ChainDiagnosticKind::BROKEN_LINK), nHeight(0), chunkIndex(0) {}
    ChainDiagnostic(ChainDiagnosticKind kindIn, const DaEnvelope& env, const uint256& expectedIn);

    /** Everything except INCOMPLETE_BLOB breaks the chain */
    bool IsViolation() const { return kind != ChainDiagnosticKind::INCOMPLETE_BLOB; }

    std::string ToString() const;
};

enum class ChainStatus {
    CHAINED,  //!< every link holds and every blob seen is complete
    PENDING,  //!< no violation so far but some blobs are not fully observed
    BROKEN,   //!< at least one violation
};

std::string ChainStatusString(ChainStatus status);

/** Collects the outcome of a chain validation run */
class ChainValidationState {
public:
    ChainValidationState() : m_violations(0), m_checked(0) {}

    void AddDiagnostic(const ChainDiagnostic& diag);
    void MarkChecked() { ++m_checked; }

    bool IsValid() const { return m_violations == 0; }
    ChainStatus GetStatus() const;

    const std::vector<ChainDiagnostic>& GetDiagnostics() const { return m_diagnostics; }
    size_t GetViolationCount() const { return m_violations; }

    /** Number of envelopes whose back-reference was checked */
    size_t GetCheckedCount() const { return m_checked; }

    std::string ToString() const;

private:
    std::vector<ChainDiagnostic> m_diagnostics;
    size_t m_violations;
    size_t m_checked;
};

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate the full back-reference chain across all blobs
 *
 * The expected predecessor starts at zero and advances to the wtxid of each
 * blob's last chunk once that chunk has been checked. Scanning continues
 * past violations so every broken link is reported.
 *
 * @param envelopes Envelopes in scan order
 * @param[out] state Diagnostics
 * @return false iff at least one violation was found
 */
bool ValidateGlobalChain(const std::vector<DaEnvelope>& envelopes, ChainValidationState& state);

/**
 * @brief Validate only the intra-blob links of one blob
 *
 * Chunk 0 is not checked, so the result does not depend on other blobs
 * interleaved in the same height range.
 */
bool ValidateWithinBlob(const std::vector<DaEnvelope>& envelopes, const uint256& blobHash,
                        ChainValidationState& state);

} // namespace da

#endif // DACHECK_DA_CHAIN_VALIDATOR_H
