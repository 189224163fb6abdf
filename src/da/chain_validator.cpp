// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <da/chain_validator.h>

#include <da/reassembly.h>
#include <util.h>

#include <map>
#include <unordered_map>

namespace da {

// ============================================================================
// Diagnostics
// ============================================================================

std::string ChainDiagnosticKindString(ChainDiagnosticKind kind)
{
    switch (kind) {
    case ChainDiagnosticKind::BROKEN_LINK: return "broken-link";
    case ChainDiagnosticKind::BROKEN_INTRA_BLOB_LINK: return "broken-intra-blob-link";
    case ChainDiagnosticKind::DUPLICATE_CHUNK: return "duplicate-chunk";
    case ChainDiagnosticKind::INCOMPLETE_BLOB: return "incomplete-blob";
    }
    return "unknown";
}

ChainDiagnostic::ChainDiagnostic(ChainDiagnosticKind kindIn, const DaEnvelope& env, const uint256& expectedIn)
    : kind(kindIn), txid(env.txid), wtxid(env.wtxid), nHeight(env.nHeight), blobHash(env.blobHash),
      chunkIndex(env.chunkIndex), expected(expectedIn), actual(env.prevTailWtxid)
{
}

std::string ChainDiagnostic::ToString() const
{
    std::string str = strprintf("%s: tx %s (wtxid %s) at height %d, blob %s chunk %u",
                                ChainDiagnosticKindString(kind), txid.GetHex(), wtxid.GetHex(), nHeight,
                                blobHash.ToString().substr(0, 16), chunkIndex);
    switch (kind) {
    case ChainDiagnosticKind::BROKEN_LINK:
    case ChainDiagnosticKind::BROKEN_INTRA_BLOB_LINK:
        str += strprintf(": expected prev %s, got %s", expected.GetHex(), actual.GetHex());
        break;
    case ChainDiagnosticKind::DUPLICATE_CHUNK:
        str += strprintf(": index already carried by wtxid %s", expected.GetHex());
        break;
    case ChainDiagnosticKind::INCOMPLETE_BLOB:
        str += ": blob not fully observed";
        break;
    }
    return str;
}

std::string ChainStatusString(ChainStatus status)
{
    switch (status) {
    case ChainStatus::CHAINED: return "chained";
    case ChainStatus::PENDING: return "pending";
    case ChainStatus::BROKEN: return "broken";
    }
    return "unknown";
}

void ChainValidationState::AddDiagnostic(const ChainDiagnostic& diag)
{
    if (diag.IsViolation()) {
        ++m_violations;
    }
    m_diagnostics.push_back(diag);
}

ChainStatus ChainValidationState::GetStatus() const
{
    if (m_violations > 0) {
        return ChainStatus::BROKEN;
    }
    return m_diagnostics.empty() ? ChainStatus::CHAINED : ChainStatus::PENDING;
}

std::string ChainValidationState::ToString() const
{
    return strprintf("ChainValidationState(status=%s, checked=%u, violations=%u, diagnostics=%u)",
                     ChainStatusString(GetStatus()), m_checked, m_violations, m_diagnostics.size());
}

// ============================================================================
// Chain walk
// ============================================================================

namespace {

/** Progress of one blob through the walk */
struct BlobProgress {
    /** Chunks checked so far, by index */
    std::vector<const DaEnvelope*> vChecked;

    /** Chunks waiting for their predecessor */
    std::map<uint16_t, const DaEnvelope*> mapParked;

    bool fDone;

    BlobProgress() : fDone(false) {}

    uint16_t NextIndex() const { return static_cast<uint16_t>(vChecked.size()); }
};

class ChainWalker {
public:
    ChainWalker(ChainValidationState& state, bool fCheckFirstChunk)
        : m_state(state), m_fCheckFirstChunk(fCheckFirstChunk) {}

    void Process(const DaEnvelope& env);
    void Finish();

private:
    void Check(const DaEnvelope& env, BlobProgress& progress);
    void Duplicate(const DaEnvelope& env, const uint256& existing);

    ChainValidationState& m_state;
    const bool m_fCheckFirstChunk;

    /** Back-reference required of the next blob's chunk 0 */
    uint256 m_expectedPrev;

    std::unordered_map<uint256, BlobProgress, BlobHashHasher> m_blobs;

    /** Blob hashes in first-seen order, for deterministic reporting */
    std::vector<uint256> m_order;
};

void ChainWalker::Duplicate(const DaEnvelope& env, const uint256& existing)
{
    if (existing == env.wtxid) {
        LogPrint(BCLog::CHAIN, "ChainWalker: ignoring re-observed carrier %s\n", env.wtxid.GetHex());
        return;
    }
    ChainDiagnostic diag(ChainDiagnosticKind::DUPLICATE_CHUNK, env, existing);
    LogPrint(BCLog::CHAIN, "ChainWalker: %s\n", diag.ToString());
    m_state.AddDiagnostic(diag);
}

void ChainWalker::Check(const DaEnvelope& env, BlobProgress& progress)
{
    if (env.chunkIndex == 0) {
        if (m_fCheckFirstChunk && env.prevTailWtxid != m_expectedPrev) {
            ChainDiagnostic diag(ChainDiagnosticKind::BROKEN_LINK, env, m_expectedPrev);
            LogPrint(BCLog::CHAIN, "ChainWalker: %s\n", diag.ToString());
            m_state.AddDiagnostic(diag);
        }
    } else if (env.prevTailWtxid != progress.vChecked.back()->wtxid) {
        ChainDiagnostic diag(ChainDiagnosticKind::BROKEN_INTRA_BLOB_LINK, env, progress.vChecked.back()->wtxid);
        LogPrint(BCLog::CHAIN, "ChainWalker: %s\n", diag.ToString());
        m_state.AddDiagnostic(diag);
    }
    m_state.MarkChecked();
    progress.vChecked.push_back(&env);

    if (env.IsLastChunk()) {
        progress.fDone = true;
        m_expectedPrev = env.wtxid;
    }
}

void ChainWalker::Process(const DaEnvelope& env)
{
    auto it = m_blobs.find(env.blobHash);
    if (it == m_blobs.end()) {
        m_order.push_back(env.blobHash);
        it = m_blobs.emplace(env.blobHash, BlobProgress()).first;
    }
    BlobProgress& progress = it->second;

    if (env.chunkIndex < progress.NextIndex()) {
        Duplicate(env, progress.vChecked[env.chunkIndex]->wtxid);
        return;
    }

    if (env.chunkIndex > progress.NextIndex() || progress.fDone) {
        auto parked = progress.mapParked.find(env.chunkIndex);
        if (parked != progress.mapParked.end()) {
            Duplicate(env, parked->second->wtxid);
        } else {
            LogPrint(BCLog::CHAIN, "ChainWalker: parking chunk %u of blob %s until chunk %u is seen\n",
                     env.chunkIndex, env.blobHash.ToString(), env.chunkIndex - 1);
            progress.mapParked.emplace(env.chunkIndex, &env);
        }
        return;
    }

    Check(env, progress);

    // Release chunks that were waiting for this one
    while (!progress.fDone) {
        auto next = progress.mapParked.find(progress.NextIndex());
        if (next == progress.mapParked.end()) {
            break;
        }
        const DaEnvelope* parked = next->second;
        progress.mapParked.erase(next);
        Check(*parked, progress);
    }
}

void ChainWalker::Finish()
{
    for (const uint256& blobHash : m_order) {
        const BlobProgress& progress = m_blobs[blobHash];
        if (!progress.fDone && !progress.vChecked.empty()) {
            LogPrint(BCLog::CHAIN, "ChainWalker: blob %s still in progress after %u chunks\n",
                     blobHash.ToString(), progress.vChecked.size());
            m_state.AddDiagnostic(ChainDiagnostic(ChainDiagnosticKind::INCOMPLETE_BLOB,
                                                  *progress.vChecked.back(), uint256()));
        }
        for (const auto& entry : progress.mapParked) {
            m_state.AddDiagnostic(ChainDiagnostic(ChainDiagnosticKind::INCOMPLETE_BLOB, *entry.second, uint256()));
        }
    }
}

} // anonymous namespace

bool ValidateGlobalChain(const std::vector<DaEnvelope>& envelopes, ChainValidationState& state)
{
    ChainWalker walker(state, true);
    for (const auto& env : envelopes) {
        walker.Process(env);
    }
    walker.Finish();
    return state.IsValid();
}

bool ValidateWithinBlob(const std::vector<DaEnvelope>& envelopes, const uint256& blobHash,
                        ChainValidationState& state)
{
    ChainWalker walker(state, false);
    for (const auto& env : envelopes) {
        if (env.blobHash == blobHash) {
            walker.Process(env);
        }
    }
    walker.Finish();
    return state.IsValid();
}

} // namespace da
