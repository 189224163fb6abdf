// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file reassembly.cpp
 * @brief Implementation of DA blob reassembly
 */

#include <da/reassembly.h>

#include <util.h>

#include <sstream>
#include <unordered_map>
#include <utility>

namespace da {

namespace {

typedef std::vector<const DaEnvelope*> EnvelopeGroup;

/**
 * Build the report for one group. On COMPLETE, ordered receives the group's
 * envelopes indexed by chunk index.
 */
ReassemblyReport CheckGroup(const uint256& blobHash, const EnvelopeGroup& group, EnvelopeGroup& ordered)
{
    ReassemblyReport report;
    report.blobHash = blobHash;
    report.totalChunks = group.front()->totalChunks;
    report.nChunksSeen = group.size();

    bool fConsistent = true;
    for (const DaEnvelope* env : group) {
        if (env->totalChunks != report.totalChunks) {
            fConsistent = false;
        }
    }

    std::vector<size_t> counts(report.totalChunks, 0);
    ordered.assign(report.totalChunks, nullptr);
    for (const DaEnvelope* env : group) {
        // Only reachable when the group disagrees on total_chunks
        if (env->chunkIndex >= report.totalChunks) {
            continue;
        }
        if (counts[env->chunkIndex]++ == 0) {
            ordered[env->chunkIndex] = env;
        }
    }

    for (uint16_t i = 0; i < report.totalChunks; ++i) {
        if (counts[i] == 0) {
            report.missingIndices.push_back(i);
        } else if (counts[i] > 1) {
            report.duplicateIndices.push_back(i);
        }
    }

    report.fContiguous = report.missingIndices.empty() && report.duplicateIndices.empty() &&
                         group.size() == report.totalChunks;

    if (!fConsistent) {
        report.status = ReassemblyStatus::INCONSISTENT_TOTAL;
    } else if (!report.duplicateIndices.empty()) {
        report.status = ReassemblyStatus::DUPLICATE_CHUNK;
    } else if (!report.fContiguous) {
        report.status = ReassemblyStatus::INCOMPLETE;
    } else {
        report.status = ReassemblyStatus::COMPLETE;
    }
    return report;
}

std::string JoinIndices(const std::vector<uint16_t>& indices)
{
    std::ostringstream ss;
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i) ss << ",";
        ss << indices[i];
    }
    return ss.str();
}

} // anonymous namespace

// ============================================================================
// Blob / ReassemblyReport Implementation
// ============================================================================

std::vector<size_t> Blob::GetChunkSizes() const
{
    std::vector<size_t> sizes;
    sizes.reserve(envelopes.size());
    for (const auto& env : envelopes) {
        sizes.push_back(env.GetChunkBodySize());
    }
    return sizes;
}

std::string Blob::ToString() const
{
    return strprintf("Blob(hash=%s, chunks=%u, size=%u)",
                     blobHash.ToString().substr(0, 16), totalChunks, totalSize);
}

std::string ReassemblyStatusString(ReassemblyStatus status)
{
    switch (status) {
    case ReassemblyStatus::COMPLETE: return "complete";
    case ReassemblyStatus::INCOMPLETE: return "incomplete";
    case ReassemblyStatus::DUPLICATE_CHUNK: return "duplicate-chunk";
    case ReassemblyStatus::INCONSISTENT_TOTAL: return "inconsistent-total";
    }
    return "unknown";
}

std::string ReassemblyReport::ToString() const
{
    std::string str = strprintf("ReassemblyReport(blob=%s, status=%s, seen=%u/%u",
                                blobHash.ToString().substr(0, 16), ReassemblyStatusString(status),
                                nChunksSeen, totalChunks);
    if (!missingIndices.empty()) {
        str += ", missing=" + JoinIndices(missingIndices);
    }
    if (!duplicateIndices.empty()) {
        str += ", duplicate=" + JoinIndices(duplicateIndices);
    }
    if (IsComplete()) {
        str += strprintf(", size=%u, hash_verified=%d", totalSize, fHashVerified);
    }
    return str + ")";
}

// ============================================================================
// Reassembly
// ============================================================================

std::vector<Blob> ReassembleBlobs(const std::vector<DaEnvelope>& envelopes)
{
    std::vector<ReassembledBlob> results = ReassembleAndValidateBlobs(envelopes);
    std::vector<Blob> blobs;
    blobs.reserve(results.size());
    for (auto& result : results) {
        if (!result.report.fHashVerified) {
            continue;
        }
        blobs.push_back(std::move(result.blob));
    }
    return blobs;
}

std::vector<ReassembledBlob> ReassembleAndValidateBlobs(const std::vector<DaEnvelope>& envelopes,
                                                        std::vector<ReassemblyReport>* pwithheld)
{
    // Group by blob hash, remembering first-seen order
    std::unordered_map<uint256, EnvelopeGroup, BlobHashHasher> groups;
    std::vector<uint256> order;

    for (const auto& env : envelopes) {
        auto it = groups.find(env.blobHash);
        if (it == groups.end()) {
            order.push_back(env.blobHash);
            it = groups.emplace(env.blobHash, EnvelopeGroup()).first;
        }

        bool fSeen = false;
        for (const DaEnvelope* other : it->second) {
            if (other->wtxid == env.wtxid) {
                fSeen = true;
                break;
            }
        }
        if (fSeen) {
            // Same carrier scanned twice, e.g. overlapping polling windows
            LogPrint(BCLog::DA, "Reassembly: ignoring re-observed carrier %s\n", env.wtxid.ToString());
            continue;
        }
        it->second.push_back(&env);
    }

    std::vector<ReassembledBlob> results;
    for (const uint256& blobHash : order) {
        const EnvelopeGroup& group = groups[blobHash];
        EnvelopeGroup ordered;
        ReassemblyReport report = CheckGroup(blobHash, group, ordered);

        if (!report.IsComplete()) {
            if (report.status == ReassemblyStatus::INCOMPLETE) {
                LogPrint(BCLog::DA, "Reassembly: withholding %s\n", report.ToString());
            } else {
                LogPrintf("Reassembly: rejecting %s\n", report.ToString());
            }
            if (pwithheld) {
                pwithheld->push_back(std::move(report));
            }
            continue;
        }

        ReassembledBlob result;
        result.blob.blobHash = blobHash;
        result.blob.totalChunks = report.totalChunks;
        for (const DaEnvelope* env : ordered) {
            const size_t bodySize = env->GetChunkBodySize();
            result.blob.data.insert(result.blob.data.end(),
                                    env->payload.begin() + (env->payload.size() - bodySize),
                                    env->payload.end());
            result.blob.envelopes.push_back(*env);
            report.chunkSizes.push_back(bodySize);
        }
        result.blob.totalSize = result.blob.data.size();
        report.totalSize = result.blob.totalSize;

        report.fHashVerified = ComputeBlobHash(result.blob.data) == blobHash;
        if (!report.fHashVerified) {
            LogPrintf("Reassembly: hash mismatch for blob %s (computed %s)\n",
                      blobHash.ToString(), ComputeBlobHash(result.blob.data).ToString());
        }

        LogPrint(BCLog::DA, "Reassembly: %s\n", report.ToString());
        result.report = std::move(report);
        results.push_back(std::move(result));
    }
    return results;
}

bool ValidateMultiChunkBlob(const ReassembledBlob& result, std::vector<std::string>& messages,
                            size_t minChunks, size_t maxChunkSize)
{
    bool fValid = true;
    const ReassemblyReport& report = result.report;

    if (report.totalChunks < minChunks) {
        messages.push_back(strprintf("FAIL: Expected at least %u chunks, got %u", minChunks, report.totalChunks));
        fValid = false;
    } else {
        messages.push_back(strprintf("OK: Chunk count %u >= %u", report.totalChunks, minChunks));
    }

    if (!report.fHashVerified) {
        messages.push_back("FAIL: Blob hash verification failed");
        fValid = false;
    } else {
        messages.push_back(strprintf("OK: Blob hash verified (%s...)", report.blobHash.ToString().substr(0, 16)));
    }

    for (size_t i = 0; i < report.chunkSizes.size(); ++i) {
        if (report.chunkSizes[i] > maxChunkSize) {
            messages.push_back(strprintf("FAIL: Chunk %u size %u exceeds max %u", i, report.chunkSizes[i], maxChunkSize));
            fValid = false;
        }
    }

    // Every chunk but the last should be close to full
    if (report.chunkSizes.size() > 1) {
        for (size_t i = 0; i + 1 < report.chunkSizes.size(); ++i) {
            if (report.chunkSizes[i] * 10 < maxChunkSize * 9) {
                messages.push_back(strprintf("WARN: Chunk %u size %u is less than 90%% of max (%u)",
                                             i, report.chunkSizes[i], maxChunkSize));
            }
        }
    }

    std::ostringstream sizes;
    for (size_t i = 0; i < report.chunkSizes.size(); ++i) {
        if (i) sizes << ", ";
        sizes << report.chunkSizes[i];
    }
    messages.push_back(strprintf("INFO: Total blob size: %u bytes", report.totalSize));
    messages.push_back(strprintf("INFO: Chunk sizes: [%s]", sizes.str()));
    return fValid;
}

} // namespace da
