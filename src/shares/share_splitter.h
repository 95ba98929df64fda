// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DASQUARE_SHARES_SHARE_SPLITTER_H
#define DASQUARE_SHARES_SHARE_SPLITTER_H

#include <shares/shares.h>

#include <cstdint>
#include <vector>

namespace shares {

/**
 * @brief Accumulates message and padding shares in write order
 *
 * The splitter only encodes; where each message lands is decided by the
 * caller (see non_interactive_defaults.h).
 */
class MessageShareSplitter
{
public:
    MessageShareSplitter() {}

    /** Append the shares of msg: MsgSharesUsed(msg.data.size()) of them. */
    void Write(const Message& msg);

    /**
     * Append count zero-bodied shares. They carry the namespace of the last
     * message written, or fallbackNid if nothing has been written yet.
     */
    void WriteNamespacedPaddedShares(uint32_t count, const NamespaceID& fallbackNid);

    /** Number of shares written so far */
    size_t Count() const { return m_shares.size(); }

    /** Hand over the accumulated shares, leaving the splitter empty */
    NamespacedShares Export();

private:
    NamespacedShares m_shares;
};

/** A share of nid whose body is all zero */
NamespacedShare NamespacedPaddedShare(const NamespaceID& nid);

/** count padding shares in TAIL_PADDING_NAMESPACE_ID */
NamespacedShares TailPaddedShares(uint32_t count);

} // namespace shares

#endif // DASQUARE_SHARES_SHARE_SPLITTER_H
