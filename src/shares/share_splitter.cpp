// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share_splitter.h>
#include <util.h>

#include <algorithm>

namespace shares {

void MessageShareSplitter::Write(const Message& msg)
{
    std::vector<unsigned char> rawData;
    rawData.reserve(DelimLen(msg.data.size()) + msg.data.size());
    WriteUVarint(rawData, msg.data.size());
    rawData.insert(rawData.end(), msg.data.begin(), msg.data.end());

    const uint32_t count = MsgSharesUsed(msg.data.size());
    for (uint32_t i = 0; i < count; ++i) {
        std::vector<unsigned char> share;
        share.reserve(SHARE_SIZE);
        share.insert(share.end(), msg.nid.begin(), msg.nid.end());

        size_t offset = static_cast<size_t>(i) * MSG_SHARE_SIZE;
        size_t chunk = std::min(MSG_SHARE_SIZE, rawData.size() - offset);
        share.insert(share.end(), rawData.begin() + offset, rawData.begin() + offset + chunk);
        share.resize(SHARE_SIZE, 0);

        m_shares.emplace_back(msg.nid, std::move(share));
    }

    LogPrint(DALog::SHARES, "MessageShareSplitter: wrote %s\n", msg.ToString());
}

void MessageShareSplitter::WriteNamespacedPaddedShares(uint32_t count, const NamespaceID& fallbackNid)
{
    if (count == 0) {
        return;
    }
    const NamespaceID nid = m_shares.empty() ? fallbackNid : m_shares.back().nid;
    for (uint32_t i = 0; i < count; ++i) {
        m_shares.push_back(NamespacedPaddedShare(nid));
    }
    LogPrint(DALog::SHARES, "MessageShareSplitter: wrote %u padding shares in namespace %s\n", count, nid.ToString());
}

NamespacedShares MessageShareSplitter::Export()
{
    NamespacedShares out;
    out.swap(m_shares);
    return out;
}

NamespacedShare NamespacedPaddedShare(const NamespaceID& nid)
{
    std::vector<unsigned char> share(nid.begin(), nid.end());
    share.resize(SHARE_SIZE, 0);
    return NamespacedShare(nid, std::move(share));
}

NamespacedShares TailPaddedShares(uint32_t count)
{
    NamespacedShares out;
    out.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        out.push_back(NamespacedPaddedShare(TAIL_PADDING_NAMESPACE_ID));
    }
    return out;
}

} // namespace shares
