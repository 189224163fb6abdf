// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file da_scan_window_tests.cpp
 * @brief End-to-end tests: reveal transactions through the scan window,
 *        reassembly, batch decoding and chain validation
 */

#include <da/batch.h>
#include <da/chain_validator.h>
#include <da/reassembly.h>
#include <da/scan_window.h>
#include <test/da_test_util.h>
#include <test/test_dacheck.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <vector>

BOOST_FIXTURE_TEST_SUITE(da_scan_window_tests, BasicTestingSetup)

// ============================================================================
// Window contract
// ============================================================================

BOOST_AUTO_TEST_CASE(window_collects_only_da_transactions)
{
    DaChainBuilder builder;
    std::vector<CTransactionRef> reveals = builder.PostBlob(BuildBatchBlob(5, 40));

    da::ScanWindow window(TEST_MAGIC);
    BOOST_CHECK(window.empty());
    BOOST_CHECK_EQUAL(window.GetTipHeight(), -1);
    BOOST_CHECK(!window.AddTransaction(CTransaction(BuildPaymentTx(1)), 200));
    BOOST_CHECK(window.AddTransaction(*reveals[0], 200));
    BOOST_CHECK(!window.AddTransaction(CTransaction(BuildPaymentTx(2)), 201));
    BOOST_CHECK_EQUAL(window.size(), 1U);
    BOOST_CHECK_EQUAL(window.GetTipHeight(), 200);
}

BOOST_AUTO_TEST_CASE(window_rejects_lower_heights)
{
    std::vector<da::DaEnvelope> envelopes = MakeSingleChunkChain(3, 100);
    da::ScanWindow window(TEST_MAGIC);
    BOOST_CHECK(window.AddEnvelope(envelopes[0]));
    BOOST_CHECK(window.AddEnvelope(envelopes[2]));
    BOOST_CHECK(!window.AddEnvelope(envelopes[1]));
    BOOST_CHECK_EQUAL(window.size(), 2U);
    BOOST_CHECK(da::IsScanOrdered(window.GetEnvelopes()));
}

BOOST_AUTO_TEST_CASE(window_tolerates_overlapping_rescans)
{
    DaChainBuilder builder;
    std::vector<CTransactionRef> first = builder.PostBlob(BuildBatchBlob(5, 40));
    std::vector<CTransactionRef> second = builder.PostBlob(BuildBatchBlob(6, 40));

    da::ScanWindow window(TEST_MAGIC);
    BOOST_CHECK(window.AddTransaction(*first[0], 300));
    // Second pass rescans height 300 before moving on
    BOOST_CHECK(!window.AddTransaction(*first[0], 300));
    BOOST_CHECK(window.AddTransaction(*second[0], 301));
    BOOST_CHECK_EQUAL(window.size(), 2U);

    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateGlobalChain(window.GetEnvelopes(), state));

    window.Clear();
    BOOST_CHECK(window.empty());
    BOOST_CHECK(window.AddTransaction(*first[0], 10));
}

BOOST_AUTO_TEST_CASE(scan_ordered_predicate)
{
    std::vector<da::DaEnvelope> envelopes = MakeSingleChunkChain(4, 50);
    BOOST_CHECK(da::IsScanOrdered(envelopes));
    BOOST_CHECK(da::IsScanOrdered(std::vector<da::DaEnvelope>()));
    std::swap(envelopes[1], envelopes[2]);
    BOOST_CHECK(!da::IsScanOrdered(envelopes));
}

BOOST_AUTO_TEST_CASE(unordered_input_does_not_crash)
{
    std::vector<da::DaEnvelope> envelopes = MakeSingleChunkChain(6, 50);
    std::reverse(envelopes.begin(), envelopes.end());

    // Wrong answer, but a defined one
    da::ChainValidationState state;
    BOOST_CHECK(!da::ValidateGlobalChain(envelopes, state));
    BOOST_CHECK_EQUAL(da::ReassembleBlobs(envelopes).size(), 6U);
}

// ============================================================================
// Interleaved blobs
// ============================================================================

/**
 * A 3-chunk blob and a single-chunk blob posted at overlapping heights,
 * surrounded by unrelated payments. Both blobs reassemble, the global chain
 * holds across all four reveals, and the 3-chunk blob's own chain holds.
 */
BOOST_AUTO_TEST_CASE(three_chunk_blob_and_single_chunk_blob_at_shared_height)
{
    const std::vector<unsigned char> bigBatch = BuildBatchBlob(100, 600);
    const std::vector<unsigned char> smallBatch = BuildBatchBlob(101, 4);

    DaChainBuilder builder;
    std::vector<CTransactionRef> big = builder.PostBlob(bigBatch, 256);
    std::vector<CTransactionRef> small = builder.PostBlob(smallBatch, 256);
    BOOST_REQUIRE_EQUAL(big.size(), 3U);
    BOOST_REQUIRE_EQUAL(small.size(), 1U);

    da::ScanWindow window(TEST_MAGIC);
    window.AddTransaction(CTransaction(BuildPaymentTx(1)), 500);
    BOOST_CHECK(window.AddTransaction(*big[0], 500));
    BOOST_CHECK(window.AddTransaction(*big[1], 501));
    window.AddTransaction(CTransaction(BuildPaymentTx(2)), 501);
    BOOST_CHECK(window.AddTransaction(*big[2], 501));
    BOOST_CHECK(window.AddTransaction(*small[0], 501));
    window.AddTransaction(CTransaction(BuildPaymentTx(3)), 502);

    const std::vector<da::DaEnvelope>& envelopes = window.GetEnvelopes();
    BOOST_REQUIRE_EQUAL(envelopes.size(), 4U);

    // (a) both blobs reassemble and decode
    std::vector<da::ReassembledBlob> results = da::ReassembleAndValidateBlobs(envelopes);
    BOOST_REQUIRE_EQUAL(results.size(), 2U);
    BOOST_CHECK(results[0].blob.data == bigBatch);
    BOOST_CHECK(results[1].blob.data == smallBatch);
    BOOST_CHECK(results[0].report.fHashVerified);
    BOOST_CHECK(results[1].report.fHashVerified);

    std::vector<da::BatchRecord> batches(2);
    BOOST_REQUIRE(da::DecodeBatchRecord(results[0].blob, batches[0]));
    BOOST_REQUIRE(da::DecodeBatchRecord(results[1].blob, batches[1]));
    BOOST_CHECK(!batches[0].IsEmptyBatch());
    BOOST_CHECK(batches[1].IsEmptyBatch());
    std::vector<std::string> messages;
    BOOST_CHECK(da::CheckBatchProgression(batches, messages));

    // (b) the global chain holds across all four reveals
    da::ChainValidationState global;
    BOOST_CHECK(da::ValidateGlobalChain(envelopes, global));
    BOOST_CHECK(global.GetStatus() == da::ChainStatus::CHAINED);
    BOOST_CHECK_EQUAL(global.GetCheckedCount(), 4U);

    // (c) the 3-chunk blob's own chain holds
    da::ChainValidationState within;
    BOOST_CHECK(da::ValidateWithinBlob(envelopes, results[0].blob.blobHash, within));
    BOOST_CHECK_EQUAL(within.GetCheckedCount(), 3U);

    BOOST_CHECK(builder.GetTailWtxid() == small[0]->GetWitnessHash());
}

/**
 * A single-chunk blob posted between chunk 1 and chunk 2 of a 3-chunk blob.
 * Its reveal links to whatever preceded the 3-chunk blob, because the
 * global back-reference only moves once a blob's last chunk is posted.
 * Chunk 2 still links to chunk 1.
 */
BOOST_AUTO_TEST_CASE(single_chunk_blob_between_chunks_of_another_blob)
{
    const std::vector<unsigned char> bigBatch = BuildBatchBlob(200, 600);
    const std::vector<unsigned char> smallBatch = BuildBatchBlob(201, 4);
    const std::vector<std::vector<unsigned char>> bigChunks = da::EncodeChunks(bigBatch, 256);
    const std::vector<std::vector<unsigned char>> smallChunks = da::EncodeChunks(smallBatch, 256);
    BOOST_REQUIRE_EQUAL(bigChunks.size(), 3U);
    BOOST_REQUIRE_EQUAL(smallChunks.size(), 1U);

    const CTransaction a0(BuildRevealTx(TEST_MAGIC, bigChunks[0], uint256(), 1));
    const CTransaction a1(BuildRevealTx(TEST_MAGIC, bigChunks[1], a0.GetWitnessHash(), 2));
    const CTransaction b0(BuildRevealTx(TEST_MAGIC, smallChunks[0], uint256(), 3));
    const CTransaction a2(BuildRevealTx(TEST_MAGIC, bigChunks[2], a1.GetWitnessHash(), 4));

    da::ScanWindow window(TEST_MAGIC);
    BOOST_CHECK(window.AddTransaction(a0, 700));
    BOOST_CHECK(window.AddTransaction(a1, 701));
    BOOST_CHECK(window.AddTransaction(b0, 701));
    BOOST_CHECK(window.AddTransaction(a2, 702));
    const std::vector<da::DaEnvelope>& envelopes = window.GetEnvelopes();
    BOOST_REQUIRE_EQUAL(envelopes.size(), 4U);

    da::ChainValidationState global;
    BOOST_CHECK(da::ValidateGlobalChain(envelopes, global));
    BOOST_CHECK(global.GetStatus() == da::ChainStatus::CHAINED);
    BOOST_CHECK_EQUAL(global.GetCheckedCount(), 4U);
    BOOST_CHECK_EQUAL(global.GetViolationCount(), 0U);

    // The small blob's first chunk is seen after the big blob's, so it comes second
    std::vector<da::ReassembledBlob> results = da::ReassembleAndValidateBlobs(envelopes);
    BOOST_REQUIRE_EQUAL(results.size(), 2U);
    BOOST_CHECK(results[0].blob.data == bigBatch);
    BOOST_CHECK(results[1].blob.data == smallBatch);
    BOOST_CHECK(results[0].report.fHashVerified);
    BOOST_CHECK(results[1].report.fHashVerified);

    da::ChainValidationState within;
    BOOST_CHECK(da::ValidateWithinBlob(envelopes, results[0].blob.blobHash, within));
    BOOST_CHECK_EQUAL(within.GetCheckedCount(), 3U);
}

BOOST_AUTO_TEST_CASE(single_chunk_blob_linking_to_unfinished_blob_breaks_chain)
{
    const std::vector<std::vector<unsigned char>> bigChunks = da::EncodeChunks(BuildBatchBlob(300, 600), 256);
    const std::vector<std::vector<unsigned char>> smallChunks = da::EncodeChunks(BuildBatchBlob(301, 4), 256);
    BOOST_REQUIRE_EQUAL(bigChunks.size(), 3U);

    const CTransaction a0(BuildRevealTx(TEST_MAGIC, bigChunks[0], uint256(), 1));
    const CTransaction a1(BuildRevealTx(TEST_MAGIC, bigChunks[1], a0.GetWitnessHash(), 2));
    // Links to chunk 1 of an unfinished blob instead of the previous tail
    const CTransaction b0(BuildRevealTx(TEST_MAGIC, smallChunks[0], a1.GetWitnessHash(), 3));
    const CTransaction a2(BuildRevealTx(TEST_MAGIC, bigChunks[2], a1.GetWitnessHash(), 4));

    da::ScanWindow window(TEST_MAGIC);
    BOOST_CHECK(window.AddTransaction(a0, 700));
    BOOST_CHECK(window.AddTransaction(a1, 701));
    BOOST_CHECK(window.AddTransaction(b0, 701));
    BOOST_CHECK(window.AddTransaction(a2, 702));

    da::ChainValidationState global;
    BOOST_CHECK(!da::ValidateGlobalChain(window.GetEnvelopes(), global));
    BOOST_CHECK(global.GetStatus() == da::ChainStatus::BROKEN);
    BOOST_REQUIRE_EQUAL(global.GetViolationCount(), 1U);

    const da::ChainDiagnostic* broken = nullptr;
    for (const da::ChainDiagnostic& diag : global.GetDiagnostics()) {
        if (diag.IsViolation()) broken = &diag;
    }
    BOOST_REQUIRE(broken != nullptr);
    BOOST_CHECK(broken->kind == da::ChainDiagnosticKind::BROKEN_LINK);
    BOOST_CHECK(broken->wtxid == b0.GetWitnessHash());
    BOOST_CHECK(broken->expected.IsNull());
    BOOST_CHECK(broken->actual == a1.GetWitnessHash());
}

BOOST_AUTO_TEST_CASE(blob_spread_over_polling_passes)
{
    const std::vector<unsigned char> batch = BuildBatchBlob(7, 900);
    DaChainBuilder builder;
    std::vector<CTransactionRef> reveals = builder.PostBlob(batch, 300);
    BOOST_REQUIRE_EQUAL(reveals.size(), 4U);

    da::ScanWindow window(TEST_MAGIC);
    BOOST_CHECK(window.AddTransaction(*reveals[0], 10));
    BOOST_CHECK(window.AddTransaction(*reveals[1], 10));

    // First pass: nothing to emit yet, chain pending
    std::vector<da::ReassemblyReport> withheld;
    BOOST_CHECK(da::ReassembleAndValidateBlobs(window.GetEnvelopes(), &withheld).empty());
    BOOST_REQUIRE_EQUAL(withheld.size(), 1U);
    BOOST_CHECK(withheld[0].status == da::ReassemblyStatus::INCOMPLETE);
    da::ChainValidationState pending;
    BOOST_CHECK(da::ValidateGlobalChain(window.GetEnvelopes(), pending));
    BOOST_CHECK(pending.GetStatus() == da::ChainStatus::PENDING);

    // Second pass overlaps the first
    BOOST_CHECK(!window.AddTransaction(*reveals[1], 10));
    BOOST_CHECK(window.AddTransaction(*reveals[2], 11));
    BOOST_CHECK(window.AddTransaction(*reveals[3], 12));

    std::vector<da::Blob> blobs = da::ReassembleBlobs(window.GetEnvelopes());
    BOOST_REQUIRE_EQUAL(blobs.size(), 1U);
    BOOST_CHECK(blobs[0].data == batch);
    da::ChainValidationState done;
    BOOST_CHECK(da::ValidateGlobalChain(window.GetEnvelopes(), done));
    BOOST_CHECK(done.GetStatus() == da::ChainStatus::CHAINED);
}

BOOST_AUTO_TEST_SUITE_END()
