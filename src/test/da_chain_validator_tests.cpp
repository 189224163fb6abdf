// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file da_chain_validator_tests.cpp
 * @brief Tests for wtxid back-reference chain validation
 *
 * Property: a chain of k correctly linked blobs validates; replacing any
 * single back-reference with an unrelated value fails validation with a
 * diagnostic naming exactly that envelope.
 */

#include <da/chain_validator.h>
#include <da/reassembly.h>
#include <test/da_test_util.h>
#include <test/test_dacheck.h>

#include <boost/test/unit_test.hpp>

#include <vector>

namespace {

/** A correctly linked multi-chunk blob continuing from prev */
std::vector<da::DaEnvelope> LinkedBlob(uint16_t nChunks, const uint256& prev, int nHeight = 100)
{
    std::vector<da::DaEnvelope> envelopes;
    const uint256 hash = InsecureRand256();
    uint256 link = prev;
    for (uint16_t i = 0; i < nChunks; ++i) {
        const uint256 wtxid = InsecureRand256();
        envelopes.push_back(MakeEnvelope(hash, i, nChunks, wtxid, link, nHeight));
        link = wtxid;
    }
    return envelopes;
}

size_t CountKind(const da::ChainValidationState& state, da::ChainDiagnosticKind kind)
{
    size_t n = 0;
    for (const auto& diag : state.GetDiagnostics()) {
        if (diag.kind == kind) ++n;
    }
    return n;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(da_chain_validator_tests, BasicTestingSetup)

// ============================================================================
// Global chain
// ============================================================================

BOOST_AUTO_TEST_CASE(empty_input_is_valid)
{
    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateGlobalChain(std::vector<da::DaEnvelope>(), state));
    BOOST_CHECK(state.GetStatus() == da::ChainStatus::CHAINED);
    BOOST_CHECK(state.GetDiagnostics().empty());
}

BOOST_AUTO_TEST_CASE(single_chunk_chain_valid)
{
    std::vector<da::DaEnvelope> envelopes = MakeSingleChunkChain(8);
    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateGlobalChain(envelopes, state));
    BOOST_CHECK(state.GetStatus() == da::ChainStatus::CHAINED);
    BOOST_CHECK_EQUAL(state.GetCheckedCount(), 8U);
}

BOOST_AUTO_TEST_CASE(any_flipped_link_is_named)
{
    const size_t k = 6;
    for (size_t flip = 0; flip < k; ++flip) {
        std::vector<da::DaEnvelope> envelopes = MakeSingleChunkChain(k);
        envelopes[flip].prevTailWtxid = InsecureRand256();

        da::ChainValidationState state;
        BOOST_CHECK(!da::ValidateGlobalChain(envelopes, state));
        BOOST_CHECK(state.GetStatus() == da::ChainStatus::BROKEN);
        BOOST_REQUIRE_EQUAL(state.GetViolationCount(), 1U);
        const da::ChainDiagnostic& diag = state.GetDiagnostics().front();
        BOOST_CHECK(diag.kind == da::ChainDiagnosticKind::BROKEN_LINK);
        BOOST_CHECK(diag.wtxid == envelopes[flip].wtxid);
        BOOST_CHECK(diag.actual == envelopes[flip].prevTailWtxid);
        BOOST_CHECK(diag.expected == (flip == 0 ? uint256() : envelopes[flip - 1].wtxid));
        BOOST_CHECK(diag.ToString().find(envelopes[flip].txid.GetHex()) != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(scanning_continues_past_violations)
{
    std::vector<da::DaEnvelope> envelopes = MakeSingleChunkChain(5);
    envelopes[1].prevTailWtxid = InsecureRand256();
    envelopes[3].prevTailWtxid = InsecureRand256();

    da::ChainValidationState state;
    BOOST_CHECK(!da::ValidateGlobalChain(envelopes, state));
    BOOST_CHECK_EQUAL(state.GetViolationCount(), 2U);
}

BOOST_AUTO_TEST_CASE(first_envelope_must_link_to_zero)
{
    std::vector<da::DaEnvelope> envelopes = MakeSingleChunkChain(2);
    envelopes[0].prevTailWtxid = InsecureRand256();
    envelopes[1].prevTailWtxid = envelopes[0].wtxid;

    da::ChainValidationState state;
    BOOST_CHECK(!da::ValidateGlobalChain(envelopes, state));
    BOOST_CHECK_EQUAL(state.GetViolationCount(), 1U);
}

BOOST_AUTO_TEST_CASE(multi_chunk_blobs_chain_through_tails)
{
    std::vector<da::DaEnvelope> envelopes = LinkedBlob(3, uint256());
    std::vector<da::DaEnvelope> next = LinkedBlob(2, envelopes.back().wtxid);
    envelopes.insert(envelopes.end(), next.begin(), next.end());

    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateGlobalChain(envelopes, state));
    BOOST_CHECK(state.GetStatus() == da::ChainStatus::CHAINED);

    // Linking the second blob to a non-tail chunk breaks the chain
    envelopes[3].prevTailWtxid = envelopes[1].wtxid;
    da::ChainValidationState broken;
    BOOST_CHECK(!da::ValidateGlobalChain(envelopes, broken));
    BOOST_CHECK_EQUAL(CountKind(broken, da::ChainDiagnosticKind::BROKEN_LINK), 1U);
}

// ============================================================================
// Intra-blob chain
// ============================================================================

BOOST_AUTO_TEST_CASE(intra_blob_link_independent_of_completeness)
{
    std::vector<da::DaEnvelope> envelopes = LinkedBlob(3, uint256());
    envelopes[2].prevTailWtxid = envelopes[0].wtxid;
    const uint256 hash = envelopes[0].blobHash;

    da::ChainValidationState state;
    BOOST_CHECK(!da::ValidateWithinBlob(envelopes, hash, state));
    BOOST_REQUIRE_EQUAL(state.GetViolationCount(), 1U);
    const da::ChainDiagnostic& diag = state.GetDiagnostics().front();
    BOOST_CHECK(diag.kind == da::ChainDiagnosticKind::BROKEN_INTRA_BLOB_LINK);
    BOOST_CHECK_EQUAL(diag.chunkIndex, 2);
    BOOST_CHECK(diag.expected == envelopes[1].wtxid);

    // Reassembly only looks at the index set
    std::vector<da::ReassembledBlob> results = da::ReassembleAndValidateBlobs(envelopes);
    BOOST_REQUIRE_EQUAL(results.size(), 1U);
    BOOST_CHECK(results[0].report.IsComplete());
}

BOOST_AUTO_TEST_CASE(within_blob_ignores_first_chunk_link)
{
    std::vector<da::DaEnvelope> envelopes = LinkedBlob(3, InsecureRand256());
    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateWithinBlob(envelopes, envelopes[0].blobHash, state));
    BOOST_CHECK(state.GetStatus() == da::ChainStatus::CHAINED);

    da::ChainValidationState global;
    BOOST_CHECK(!da::ValidateGlobalChain(envelopes, global));
}

BOOST_AUTO_TEST_CASE(within_blob_filters_other_blobs)
{
    std::vector<da::DaEnvelope> envelopes = LinkedBlob(3, uint256());
    std::vector<da::DaEnvelope> noise = MakeSingleChunkChain(2);
    noise[1].prevTailWtxid = InsecureRand256();
    envelopes.insert(envelopes.begin() + 1, noise.begin(), noise.end());

    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateWithinBlob(envelopes, envelopes[0].blobHash, state));
    BOOST_CHECK_EQUAL(state.GetCheckedCount(), 3U);
}

// ============================================================================
// Partial observation
// ============================================================================

BOOST_AUTO_TEST_CASE(out_of_order_chunks_are_parked)
{
    std::vector<da::DaEnvelope> envelopes = LinkedBlob(4, uint256());
    std::vector<da::DaEnvelope> reordered{envelopes[2], envelopes[0], envelopes[3], envelopes[1]};

    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateGlobalChain(reordered, state));
    BOOST_CHECK(state.GetStatus() == da::ChainStatus::CHAINED);
    BOOST_CHECK_EQUAL(state.GetCheckedCount(), 4U);
}

BOOST_AUTO_TEST_CASE(incomplete_blob_is_pending)
{
    std::vector<da::DaEnvelope> envelopes = LinkedBlob(3, uint256());
    envelopes.erase(envelopes.begin() + 1);

    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateGlobalChain(envelopes, state));
    BOOST_CHECK(state.GetStatus() == da::ChainStatus::PENDING);
    BOOST_CHECK_EQUAL(CountKind(state, da::ChainDiagnosticKind::INCOMPLETE_BLOB), 2U);
    for (const auto& diag : state.GetDiagnostics()) {
        BOOST_CHECK(!diag.IsViolation());
    }

    // Not yet started: only the tail chunk was observed
    std::vector<da::DaEnvelope> tail{LinkedBlob(2, uint256()).back()};
    da::ChainValidationState tailState;
    BOOST_CHECK(da::ValidateGlobalChain(tail, tailState));
    BOOST_CHECK(tailState.GetStatus() == da::ChainStatus::PENDING);
}

BOOST_AUTO_TEST_CASE(duplicate_carriers)
{
    std::vector<da::DaEnvelope> envelopes = LinkedBlob(3, uint256());

    // Identical carrier seen again: ignored
    std::vector<da::DaEnvelope> rescanned = envelopes;
    rescanned.push_back(envelopes[1]);
    da::ChainValidationState state;
    BOOST_CHECK(da::ValidateGlobalChain(rescanned, state));
    BOOST_CHECK(state.GetStatus() == da::ChainStatus::CHAINED);

    // A different carrier for the same index: violation
    da::DaEnvelope other = envelopes[1];
    other.wtxid = InsecureRand256();
    other.txid = other.wtxid;
    std::vector<da::DaEnvelope> conflicting = envelopes;
    conflicting.push_back(other);
    da::ChainValidationState conflictState;
    BOOST_CHECK(!da::ValidateGlobalChain(conflicting, conflictState));
    BOOST_CHECK_EQUAL(CountKind(conflictState, da::ChainDiagnosticKind::DUPLICATE_CHUNK), 1U);
    BOOST_CHECK(conflictState.GetDiagnostics().front().expected == envelopes[1].wtxid);
}

BOOST_AUTO_TEST_CASE(status_strings)
{
    BOOST_CHECK_EQUAL(da::ChainStatusString(da::ChainStatus::CHAINED), "chained");
    BOOST_CHECK_EQUAL(da::ChainStatusString(da::ChainStatus::PENDING), "pending");
    BOOST_CHECK_EQUAL(da::ChainStatusString(da::ChainStatus::BROKEN), "broken");
    BOOST_CHECK_EQUAL(da::ChainDiagnosticKindString(da::ChainDiagnosticKind::BROKEN_LINK), "broken-link");
}

BOOST_AUTO_TEST_SUITE_END()
