// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_DA_SCAN_WINDOW_H
#define DACHECK_DA_SCAN_WINDOW_H

/**
 * @file scan_window.h
 * @brief Ordered accumulation of DA envelopes across polling passes
 *
 * Reassembly and chain validation both assume their input is in scan order:
 * height ascending, then position within the block. A ScanWindow is fed one
 * transaction at a time by a caller walking the chain and keeps that order
 * by construction. Overlapping rescans of a height range are tolerated.
 */

#include <da/envelope.h>
#include <primitives/transaction.h>
#include <uint256.h>

#include <set>
#include <vector>

namespace da {

class ScanWindow {
public:
    explicit ScanWindow(const DaMagic& magic) : m_extractor(magic), m_nTipHeight(-1) {}

    /**
     * @brief Run the extractor on a transaction and append its envelope
     * @return true if the transaction carried a DA envelope that was added
     */
    bool AddTransaction(const CTransaction& tx, int nHeight);

    /**
     * @brief Append an already extracted envelope
     * @return false if the envelope is below the window tip or was already added
     */
    bool AddEnvelope(const DaEnvelope& env);

    const std::vector<DaEnvelope>& GetEnvelopes() const { return m_envelopes; }

    /** Height of the most recent envelope, -1 when empty */
    int GetTipHeight() const { return m_nTipHeight; }

    const EnvelopeExtractor& GetExtractor() const { return m_extractor; }

    size_t size() const { return m_envelopes.size(); }
    bool empty() const { return m_envelopes.empty(); }

    void Clear();

private:
    EnvelopeExtractor m_extractor;
    std::vector<DaEnvelope> m_envelopes;
    std::set<uint256> m_setWtxids;
    int m_nTipHeight;
};

/** True if heights never decrease along the sequence */
bool IsScanOrdered(const std::vector<DaEnvelope>& envelopes);

} // namespace da

#endif // DACHECK_DA_SCAN_WINDOW_H
