// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_DA_REASSEMBLY_H
#define DACHECK_DA_REASSEMBLY_H

/**
 * @file reassembly.h
 * @brief Reassembly of chunked DA blobs
 *
 * Envelopes are grouped by blob hash. A group is complete when it holds
 * exactly total_chunks envelopes whose chunk indices are {0..total_chunks-1}
 * without repetition and which all agree on total_chunks. Only complete
 * groups produce a Blob; the rest are withheld until a later call sees a
 * larger window.
 *
 * Input must be in scan order (height ascending, then position within the
 * block). Reassembly itself is order independent, but the constituent
 * envelopes it returns are used for chain bookkeeping.
 */

#include <da/chunk_header.h>
#include <da/envelope.h>
#include <uint256.h>

#include <cstdint>
#include <string>
#include <vector>

namespace da {

/** Hasher for containers keyed by blob hash; blob hashes are uniformly random */
struct BlobHashHasher {
    size_t operator()(const uint256& hash) const { return hash.GetCheapHash(); }
};

/** A complete logical blob */
struct Blob {
    uint256 blobHash;
    uint16_t totalChunks;
    uint64_t totalSize;

    /** Concatenated chunk bodies */
    std::vector<unsigned char> data;

    /** Constituent envelopes ordered by chunk index */
    std::vector<DaEnvelope> envelopes;

    Blob() : totalChunks(0), totalSize(0) {}

    /** Body size of each chunk, in chunk order */
    std::vector<size_t> GetChunkSizes() const;

    std::string ToString() const;
};

enum class ReassemblyStatus {
    COMPLETE,            //!< all chunks present exactly once
    INCOMPLETE,          //!< some chunk indices not observed yet
    DUPLICATE_CHUNK,     //!< two different carriers claim the same chunk index
    INCONSISTENT_TOTAL,  //!< envelopes disagree on total_chunks
};

std::string ReassemblyStatusString(ReassemblyStatus status);

/** Completeness and integrity diagnostics for one blob hash group */
struct ReassemblyReport {
    uint256 blobHash;
    ReassemblyStatus status;

    /** total_chunks declared by the first envelope of the group */
    uint16_t totalChunks;

    /** Number of envelopes seen for this blob */
    size_t nChunksSeen;

    /** Indices in [0, totalChunks) not observed */
    std::vector<uint16_t> missingIndices;

    /** Indices observed more than once */
    std::vector<uint16_t> duplicateIndices;

    /** Observed indices form exactly {0..totalChunks-1} */
    bool fContiguous;

    /** SHA-256 of the reassembled bytes equals blobHash (complete groups only) */
    bool fHashVerified;

    /** Body sizes in chunk order (complete groups only) */
    std::vector<size_t> chunkSizes;
    uint64_t totalSize;

    ReassemblyReport()
        : status(ReassemblyStatus::INCOMPLETE), totalChunks(0), nChunksSeen(0),
          fContiguous(false), fHashVerified(false), totalSize(0) {}

    bool IsComplete() const { return status == ReassemblyStatus::COMPLETE; }

    std::string ToString() const;
};

struct ReassembledBlob {
    Blob blob;
    ReassemblyReport report;
};

/**
 * @brief Reassemble every complete blob in an envelope window
 * @param envelopes Envelopes in scan order
 * @return complete blobs whose content matches their blob hash, in the
 *         order their first chunk was seen
 */
std::vector<Blob> ReassembleBlobs(const std::vector<DaEnvelope>& envelopes);

/**
 * @brief Reassemble complete blobs and report on every group
 * @param envelopes Envelopes in scan order
 * @param[out] pwithheld If not null, receives the reports of the groups
 *             that were not emitted (incomplete, duplicated, inconsistent)
 * @return complete blobs with their reports, in first-seen order
 */
std::vector<ReassembledBlob> ReassembleAndValidateBlobs(const std::vector<DaEnvelope>& envelopes,
                                                        std::vector<ReassemblyReport>* pwithheld = nullptr);

/**
 * @brief Check that a reassembled blob looks like a well-formed multi-chunk post
 *
 * Fails when fewer than minChunks chunks were used, when the blob hash did
 * not verify or when a chunk body exceeds maxChunkSize. Non-final chunks
 * smaller than 90% of maxChunkSize only produce a warning.
 *
 * @param[out] messages OK:/FAIL:/WARN:/INFO: lines describing each check
 */
bool ValidateMultiChunkBlob(const ReassembledBlob& result, std::vector<std::string>& messages,
                            size_t minChunks = 5, size_t maxChunkSize = MAX_CHUNK_PAYLOAD);

} // namespace da

#endif // DACHECK_DA_REASSEMBLY_H
