// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file dacheck.cpp
 * @brief Command-line verifier for DA envelopes posted on the base chain
 *
 * Reads "<height> <raw transaction hex>" lines in scan order, extracts the
 * DA envelopes, reassembles blobs, decodes their batches and checks the
 * wtxid back-reference chain.
 */

#include <core_io.h>
#include <da/batch.h>
#include <da/chain_validator.h>
#include <da/envelope.h>
#include <da/reassembly.h>
#include <da/scan_window.h>
#include <primitives/transaction.h>
#include <uint256.h>
#include <util.h>
#include <utilstrencodings.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

static const int CONTINUE_EXECUTION = -1;
static const uint64_t DEFAULT_MAX_CHUNK_SIZE = da::MAX_CHUNK_PAYLOAD;

static std::string GetDaCheckHelpMessage()
{
    std::string strUsage = "dacheck - verify DA envelopes posted on the base chain\n\n";
    strUsage += "Usage:  dacheck -magic=<hex> [options] [-datafile=<file>]\n\n";
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-magic=<magic>", "DA protocol magic, as 8 hex digits or 4 ASCII characters (required)");
    strUsage += HelpMessageOpt("-datafile=<file>", "Read \"<height> <raw tx hex>\" lines from <file> (default: standard input)");
    strUsage += HelpMessageOpt("-blob=<hash>", "Also validate the intra-blob chain of this blob. Can be specified multiple times");
    strUsage += HelpMessageOpt("-minchunks=<n>", "Check every multi-chunk blob has at least <n> chunks of near maximum size");
    strUsage += HelpMessageOpt("-maxchunksize=<n>", strprintf("Maximum chunk body size for multi-chunk checks (default: %u)", DEFAULT_MAX_CHUNK_SIZE));
    strUsage += HelpMessageOpt("-conf=<file>", "Read options from <file>; command line options take precedence");

    strUsage += HelpMessageGroup("Debugging options:");
    strUsage += HelpMessageOpt("-debug=<category>", strprintf("Output debugging information. <category> can be: %s", ListLogCategories()));
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to stderr (default: 1)");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-debuglogfile=<file>", "Also append debug output to <file>");
    return strUsage;
}

//
// This function returns either one of EXIT_ codes when it's expected to stop the process or
// CONTINUE_EXECUTION when it's expected to continue further.
//
static int AppInitDaCheck(int argc, char* argv[])
{
    gArgs.ParseParameters(argc, argv);

    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", GetDaCheckHelpMessage().c_str());
        return argc < 2 ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    if (gArgs.IsArgSet("-conf")) {
        gArgs.ReadConfigFile(gArgs.GetArg("-conf", ""));
    }

    if (!InitLogging(true)) {
        return EXIT_FAILURE;
    }

    if (!gArgs.IsArgSet("-magic")) {
        fprintf(stderr, "Error: -magic is required\n");
        return EXIT_FAILURE;
    }
    return CONTINUE_EXECUTION;
}

/** Parse one input line into a transaction. Returns false on malformed input. */
static bool ParseInputLine(const std::string& strLine, int& nHeight, CMutableTransaction& mtx)
{
    const size_t nSep = strLine.find_first_of(" \t");
    if (nSep == std::string::npos) {
        return false;
    }
    int64_t n;
    if (!ParseInt64(strLine.substr(0, nSep), &n) || n < 0 || n > std::numeric_limits<int>::max()) {
        return false;
    }
    nHeight = static_cast<int>(n);
    return DecodeHexTx(mtx, TrimString(strLine.substr(nSep + 1)));
}

/** Feed every input line into the window. Returns false if any line was malformed. */
static bool ReadTransactions(std::istream& in, da::ScanWindow& window)
{
    bool fOk = true;
    std::string strLine;
    int nLine = 0;
    size_t nTxs = 0;
    while (std::getline(in, strLine)) {
        ++nLine;
        strLine = TrimString(strLine);
        if (strLine.empty() || strLine[0] == '#') {
            continue;
        }
        int nHeight;
        CMutableTransaction mtx;
        if (!ParseInputLine(strLine, nHeight, mtx)) {
            fprintf(stdout, "FAIL: line %d: expected \"<height> <raw tx hex>\"\n", nLine);
            fOk = false;
            continue;
        }
        ++nTxs;
        const CTransaction tx(std::move(mtx));
        LogPrint(BCLog::SCAN, "line %d, height %d: %s", nLine, nHeight, tx.ToString());
        window.AddTransaction(tx, nHeight);
    }
    LogPrint(BCLog::SCAN, "Read %u transactions, %u DA envelopes\n", nTxs, window.size());
    return fOk;
}

static void PrintMessages(const std::vector<std::string>& messages)
{
    for (const std::string& msg : messages) {
        fprintf(stdout, "  %s\n", msg.c_str());
    }
}

static bool PrintChainResult(const std::string& strLabel, const da::ChainValidationState& state)
{
    fprintf(stdout, "%s: %s (%u envelopes checked, %u violations)\n", strLabel.c_str(),
            da::ChainStatusString(state.GetStatus()).c_str(),
            (unsigned)state.GetCheckedCount(), (unsigned)state.GetViolationCount());
    for (const da::ChainDiagnostic& diag : state.GetDiagnostics()) {
        fprintf(stdout, "  %s: %s\n", diag.IsViolation() ? "FAIL" : "INFO", diag.ToString().c_str());
    }
    return state.IsValid();
}

/** Read a non-negative size option, reporting a FAIL: line if it is not one */
static bool GetSizeArg(const std::string& strArg, uint64_t nDefault, size_t& nOut)
{
    uint64_t n = nDefault;
    if (gArgs.IsArgSet(strArg) && !ParseUInt64(gArgs.GetArg(strArg, ""), &n)) {
        fprintf(stdout, "FAIL: %s=%s is not a non-negative integer\n", strArg.c_str(), gArgs.GetArg(strArg, "").c_str());
        return false;
    }
    if (n > std::numeric_limits<size_t>::max()) {
        fprintf(stdout, "FAIL: %s=%s is out of range\n", strArg.c_str(), gArgs.GetArg(strArg, "").c_str());
        return false;
    }
    nOut = n;
    return true;
}

static bool RunChecks(const da::ScanWindow& window)
{
    bool fOk = true;
    const std::vector<da::DaEnvelope>& envelopes = window.GetEnvelopes();
    fprintf(stdout, "Envelopes: %u (tip height %d)\n", (unsigned)envelopes.size(), window.GetTipHeight());

    // Reassembly and batch decoding
    std::vector<da::ReassemblyReport> withheld;
    const std::vector<da::ReassembledBlob> results = da::ReassembleAndValidateBlobs(envelopes, &withheld);
    std::vector<da::BatchRecord> batches;

    size_t nMinChunks = 0;
    size_t nMaxChunkSize = DEFAULT_MAX_CHUNK_SIZE;
    const bool fLimitsOk = GetSizeArg("-minchunks", 0, nMinChunks) &&
                           GetSizeArg("-maxchunksize", DEFAULT_MAX_CHUNK_SIZE, nMaxChunkSize);
    if (!fLimitsOk) {
        fOk = false;
    }

    for (const da::ReassembledBlob& result : results) {
        fprintf(stdout, "%s\n", result.report.ToString().c_str());
        if (!result.report.fHashVerified) {
            fprintf(stdout, "  FAIL: blob hash mismatch\n");
            fOk = false;
        }

        da::BatchRecord batch;
        da::BatchDecodeError err;
        if (da::DecodeBatchRecord(result.blob, batch, &err)) {
            fprintf(stdout, "  %s\n", batch.ToString().c_str());
            batches.push_back(batch);
        } else {
            fprintf(stdout, "  FAIL: %s\n", da::BatchDecodeErrorString(err).c_str());
            fOk = false;
        }

        if (fLimitsOk && gArgs.IsArgSet("-minchunks") && result.report.totalChunks > 1) {
            std::vector<std::string> messages;
            if (!da::ValidateMultiChunkBlob(result, messages, nMinChunks, nMaxChunkSize)) {
                fOk = false;
            }
            PrintMessages(messages);
        }
    }

    for (const da::ReassemblyReport& report : withheld) {
        fprintf(stdout, "%s\n", report.ToString().c_str());
        if (report.status != da::ReassemblyStatus::INCOMPLETE) {
            fprintf(stdout, "  FAIL: %s\n", da::ReassemblyStatusString(report.status).c_str());
            fOk = false;
        }
    }

    if (batches.size() > 1) {
        std::vector<std::string> messages;
        if (!da::CheckBatchProgression(batches, messages)) {
            fOk = false;
        }
        fprintf(stdout, "Batch progression:\n");
        PrintMessages(messages);
    }

    // Back-reference chain
    da::ChainValidationState state;
    da::ValidateGlobalChain(envelopes, state);
    if (!PrintChainResult("Global chain", state)) {
        fOk = false;
    }

    for (const std::string& strBlob : gArgs.GetArgs("-blob")) {
        if (strBlob.size() != 64 || !IsHex(strBlob)) {
            fprintf(stdout, "FAIL: -blob=%s is not a 32-byte hex hash\n", strBlob.c_str());
            fOk = false;
            continue;
        }
        const uint256 blobHash = uint256S(strBlob);
        da::ChainValidationState blobState;
        da::ValidateWithinBlob(envelopes, blobHash, blobState);
        if (!PrintChainResult("Blob " + blobHash.GetHex() + " chain", blobState)) {
            fOk = false;
        }
    }
    return fOk;
}

static int CommandLineDaCheck()
{
    da::DaMagic magic;
    const std::string strMagic = gArgs.GetArg("-magic", "");
    if (!da::ParseMagic(strMagic, magic)) {
        throw std::runtime_error(strprintf("invalid -magic '%s': expected 8 hex digits or 4 characters", strMagic));
    }

    da::ScanWindow window(magic);
    bool fOk;
    if (gArgs.IsArgSet("-datafile")) {
        const std::string strPath = gArgs.GetArg("-datafile", "");
        std::ifstream file(strPath);
        if (!file.is_open()) {
            throw std::runtime_error(strprintf("cannot open data file %s", strPath));
        }
        fOk = ReadTransactions(file, window);
    } else {
        fOk = ReadTransactions(std::cin, window);
    }

    if (!RunChecks(window)) {
        fOk = false;
    }
    fprintf(stdout, "%s\n", fOk ? "OK" : "FAIL");
    return fOk ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    try {
        int ret = AppInitDaCheck(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "AppInitDaCheck()");
        return EXIT_FAILURE;
    }

    int ret = EXIT_FAILURE;
    try {
        ret = CommandLineDaCheck();
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "CommandLineDaCheck()");
    }
    CloseDebugLog();
    return ret;
}
