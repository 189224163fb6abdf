// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file da_reassembly_tests.cpp
 * @brief Tests for DA blob reassembly
 *
 * Property: for any blob split into N chunks, any arrival order of the N
 * envelopes reassembles to exactly one blob whose bytes equal the original
 * and whose hash verifies. Any strict subset produces no blob.
 */

#include <da/reassembly.h>
#include <test/da_test_util.h>
#include <test/test_dacheck.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace {

/** Envelopes for a blob split into chunks of at most nMax bytes, in index order */
std::vector<da::DaEnvelope> EnvelopesForBlob(const std::vector<unsigned char>& blob, size_t nMax, int nHeight = 100)
{
    std::vector<da::DaEnvelope> envelopes;
    for (const auto& chunk : da::EncodeChunks(blob, nMax)) {
        da::DaEnvelope env;
        da::DaChunkHeader header;
        BOOST_REQUIRE(da::DaChunkHeader::Parse(chunk, header));
        env.txid = InsecureRand256();
        env.wtxid = InsecureRand256();
        env.nHeight = nHeight;
        env.blobHash = header.blobHash;
        env.chunkIndex = header.chunkIndex;
        env.totalChunks = header.totalChunks;
        env.payload = chunk;
        envelopes.push_back(env);
    }
    return envelopes;
}

void Shuffle(std::vector<da::DaEnvelope>& envelopes)
{
    for (size_t i = envelopes.size(); i > 1; --i) {
        std::swap(envelopes[i - 1], envelopes[InsecureRandRange(i)]);
    }
}

bool HasMessage(const std::vector<std::string>& messages, const std::string& prefix)
{
    for (const auto& msg : messages) {
        if (msg.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(da_reassembly_tests, BasicTestingSetup)

// ============================================================================
// Completeness
// ============================================================================

BOOST_AUTO_TEST_CASE(reassemble_any_arrival_order)
{
    for (int round = 0; round < 20; ++round) {
        const std::vector<unsigned char> blob = InsecureRandBytes(100 + InsecureRandRange(900));
        std::vector<da::DaEnvelope> envelopes = EnvelopesForBlob(blob, 64);
        Shuffle(envelopes);

        std::vector<da::ReassembledBlob> results = da::ReassembleAndValidateBlobs(envelopes);
        BOOST_REQUIRE_EQUAL(results.size(), 1U);
        BOOST_CHECK(results[0].blob.data == blob);
        BOOST_CHECK_EQUAL(results[0].blob.totalSize, blob.size());
        BOOST_CHECK(results[0].report.IsComplete());
        BOOST_CHECK(results[0].report.fContiguous);
        BOOST_CHECK(results[0].report.fHashVerified);

        // Constituents come back in index order
        for (size_t i = 0; i < results[0].blob.envelopes.size(); ++i) {
            BOOST_CHECK_EQUAL(results[0].blob.envelopes[i].chunkIndex, i);
        }
    }
}

BOOST_AUTO_TEST_CASE(reassemble_subset_is_withheld)
{
    const std::vector<unsigned char> blob = InsecureRandBytes(500);
    std::vector<da::DaEnvelope> envelopes = EnvelopesForBlob(blob, 100);
    BOOST_REQUIRE_EQUAL(envelopes.size(), 5U);
    envelopes.erase(envelopes.begin() + 1);
    envelopes.erase(envelopes.begin() + 2);

    std::vector<da::ReassemblyReport> withheld;
    BOOST_CHECK(da::ReassembleAndValidateBlobs(envelopes, &withheld).empty());
    BOOST_REQUIRE_EQUAL(withheld.size(), 1U);
    BOOST_CHECK(withheld[0].status == da::ReassemblyStatus::INCOMPLETE);
    BOOST_CHECK_EQUAL(withheld[0].nChunksSeen, 3U);
    BOOST_CHECK_EQUAL(withheld[0].totalChunks, 5);
    BOOST_REQUIRE_EQUAL(withheld[0].missingIndices.size(), 2U);
    BOOST_CHECK_EQUAL(withheld[0].missingIndices[0], 1);
    BOOST_CHECK_EQUAL(withheld[0].missingIndices[1], 3);
    BOOST_CHECK(!withheld[0].fContiguous);

    BOOST_CHECK(da::ReassembleBlobs(envelopes).empty());
}

BOOST_AUTO_TEST_CASE(reassemble_is_idempotent)
{
    std::vector<da::DaEnvelope> envelopes = EnvelopesForBlob(InsecureRandBytes(300), 100);
    std::vector<da::DaEnvelope> other = EnvelopesForBlob(InsecureRandBytes(50), 100);
    envelopes.insert(envelopes.begin() + 1, other.begin(), other.end());

    std::vector<da::Blob> first = da::ReassembleBlobs(envelopes);
    std::vector<da::Blob> second = da::ReassembleBlobs(envelopes);
    BOOST_REQUIRE_EQUAL(first.size(), 2U);
    BOOST_REQUIRE_EQUAL(second.size(), 2U);
    for (size_t i = 0; i < first.size(); ++i) {
        BOOST_CHECK(first[i].blobHash == second[i].blobHash);
        BOOST_CHECK(first[i].data == second[i].data);
    }
}

BOOST_AUTO_TEST_CASE(reassemble_first_seen_order)
{
    std::vector<da::DaEnvelope> a = EnvelopesForBlob(InsecureRandBytes(300), 100);
    std::vector<da::DaEnvelope> b = EnvelopesForBlob(InsecureRandBytes(30), 100);

    // b's only chunk arrives between a's chunks but after a's first
    std::vector<da::DaEnvelope> envelopes{a[0], b[0], a[1], a[2]};
    std::vector<da::Blob> blobs = da::ReassembleBlobs(envelopes);
    BOOST_REQUIRE_EQUAL(blobs.size(), 2U);
    BOOST_CHECK(blobs[0].blobHash == a[0].blobHash);
    BOOST_CHECK(blobs[1].blobHash == b[0].blobHash);
}

// ============================================================================
// Ambiguity
// ============================================================================

BOOST_AUTO_TEST_CASE(reassemble_duplicate_index_rejected)
{
    std::vector<da::DaEnvelope> envelopes = EnvelopesForBlob(InsecureRandBytes(300), 100);
    da::DaEnvelope dup = envelopes[1];
    dup.wtxid = InsecureRand256();
    envelopes.push_back(dup);

    std::vector<da::ReassemblyReport> withheld;
    BOOST_CHECK(da::ReassembleAndValidateBlobs(envelopes, &withheld).empty());
    BOOST_REQUIRE_EQUAL(withheld.size(), 1U);
    BOOST_CHECK(withheld[0].status == da::ReassemblyStatus::DUPLICATE_CHUNK);
    BOOST_REQUIRE_EQUAL(withheld[0].duplicateIndices.size(), 1U);
    BOOST_CHECK_EQUAL(withheld[0].duplicateIndices[0], 1);
}

BOOST_AUTO_TEST_CASE(reassemble_same_carrier_twice)
{
    const std::vector<unsigned char> blob = InsecureRandBytes(300);
    std::vector<da::DaEnvelope> envelopes = EnvelopesForBlob(blob, 100);
    envelopes.push_back(envelopes[0]);

    std::vector<da::ReassembledBlob> results = da::ReassembleAndValidateBlobs(envelopes);
    BOOST_REQUIRE_EQUAL(results.size(), 1U);
    BOOST_CHECK(results[0].blob.data == blob);
    BOOST_CHECK_EQUAL(results[0].report.nChunksSeen, 3U);
}

BOOST_AUTO_TEST_CASE(reassemble_inconsistent_total)
{
    const uint256 hash = InsecureRand256();
    std::vector<da::DaEnvelope> envelopes{
        MakeEnvelope(hash, 0, 2, InsecureRand256(), uint256()),
        MakeEnvelope(hash, 1, 3, InsecureRand256(), uint256()),
    };

    std::vector<da::ReassemblyReport> withheld;
    BOOST_CHECK(da::ReassembleAndValidateBlobs(envelopes, &withheld).empty());
    BOOST_REQUIRE_EQUAL(withheld.size(), 1U);
    BOOST_CHECK(withheld[0].status == da::ReassemblyStatus::INCONSISTENT_TOTAL);
}

// ============================================================================
// Integrity
// ============================================================================

BOOST_AUTO_TEST_CASE(reassemble_hash_mismatch_reported)
{
    std::vector<da::DaEnvelope> envelopes = EnvelopesForBlob(InsecureRandBytes(300), 100);
    envelopes[2].payload.back() ^= 0x01;

    std::vector<da::ReassembledBlob> results = da::ReassembleAndValidateBlobs(envelopes);
    BOOST_REQUIRE_EQUAL(results.size(), 1U);
    BOOST_CHECK(results[0].report.IsComplete());
    BOOST_CHECK(!results[0].report.fHashVerified);

    std::vector<std::string> messages;
    BOOST_CHECK(!da::ValidateMultiChunkBlob(results[0], messages, 3, 100));
    BOOST_CHECK(HasMessage(messages, "FAIL: Blob hash verification failed"));

    BOOST_CHECK(da::ReassembleBlobs(envelopes).empty());
}

BOOST_AUTO_TEST_CASE(validate_multi_chunk_blob)
{
    std::vector<da::DaEnvelope> envelopes = EnvelopesForBlob(InsecureRandBytes(450), 100);
    std::vector<da::ReassembledBlob> results = da::ReassembleAndValidateBlobs(envelopes);
    BOOST_REQUIRE_EQUAL(results.size(), 1U);
    BOOST_CHECK_EQUAL(results[0].report.chunkSizes.size(), 5U);
    BOOST_CHECK_EQUAL(results[0].report.chunkSizes[4], 50U);

    std::vector<std::string> messages;
    BOOST_CHECK(da::ValidateMultiChunkBlob(results[0], messages, 5, 100));
    BOOST_CHECK(HasMessage(messages, "OK: Chunk count 5 >= 5"));
    BOOST_CHECK(HasMessage(messages, "OK: Blob hash verified"));
    BOOST_CHECK(!HasMessage(messages, "WARN:"));
    BOOST_CHECK(HasMessage(messages, "INFO: Total blob size: 450 bytes"));

    messages.clear();
    BOOST_CHECK(!da::ValidateMultiChunkBlob(results[0], messages, 6, 100));
    BOOST_CHECK(HasMessage(messages, "FAIL: Expected at least 6 chunks, got 5"));

    // Oversized chunks fail, undersized non-final chunks only warn
    messages.clear();
    BOOST_CHECK(!da::ValidateMultiChunkBlob(results[0], messages, 5, 99));
    BOOST_CHECK(HasMessage(messages, "FAIL: Chunk 0 size 100 exceeds max 99"));

    messages.clear();
    BOOST_CHECK(da::ValidateMultiChunkBlob(results[0], messages, 5, 200));
    BOOST_CHECK(HasMessage(messages, "WARN: Chunk 0 size 100 is less than 90% of max (200)"));
}

BOOST_AUTO_TEST_CASE(report_to_string)
{
    std::vector<da::DaEnvelope> envelopes = EnvelopesForBlob(InsecureRandBytes(300), 100);
    envelopes.pop_back();
    std::vector<da::ReassemblyReport> withheld;
    da::ReassembleAndValidateBlobs(envelopes, &withheld);
    BOOST_REQUIRE_EQUAL(withheld.size(), 1U);
    BOOST_CHECK(withheld[0].ToString().find("missing=2") != std::string::npos);
    BOOST_CHECK(withheld[0].ToString().find("incomplete") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
