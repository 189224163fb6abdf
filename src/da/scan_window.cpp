// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <da/scan_window.h>

#include <util.h>

namespace da {

bool ScanWindow::AddTransaction(const CTransaction& tx, int nHeight)
{
    std::optional<DaEnvelope> env = m_extractor.Extract(tx, nHeight);
    if (!env) {
        return false;
    }
    return AddEnvelope(*env);
}

bool ScanWindow::AddEnvelope(const DaEnvelope& env)
{
    if (m_setWtxids.count(env.wtxid)) {
        LogPrint(BCLog::SCAN, "ScanWindow: %s already in window\n", env.wtxid.GetHex());
        return false;
    }
    if (env.nHeight < m_nTipHeight) {
        LogPrintf("ScanWindow: rejecting %s at height %d below window tip %d\n",
                  env.txid.GetHex(), env.nHeight, m_nTipHeight);
        return false;
    }

    m_setWtxids.insert(env.wtxid);
    m_envelopes.push_back(env);
    m_nTipHeight = env.nHeight;
    LogPrint(BCLog::SCAN, "ScanWindow: added %s\n", env.ToString());
    return true;
}

void ScanWindow::Clear()
{
    m_envelopes.clear();
    m_setWtxids.clear();
    m_nTipHeight = -1;
}

bool IsScanOrdered(const std::vector<DaEnvelope>& envelopes)
{
    for (size_t i = 1; i < envelopes.size(); ++i) {
        if (envelopes[i].nHeight < envelopes[i - 1].nHeight) {
            return false;
        }
    }
    return true;
}

} // namespace da
