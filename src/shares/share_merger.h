// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DASQUARE_SHARES_SHARE_MERGER_H
#define DASQUARE_SHARES_SHARE_MERGER_H

#include <shares/shares.h>

#include <string>
#include <vector>

namespace shares {

/**
 * Reassemble messages from raw message shares.
 *
 * Shares whose length prefix is zero (namespaced and tail padding) are
 * skipped. Every other share starts a message that spans
 * MsgSharesUsed(len) shares of the same namespace.
 *
 * @param[in]  rawShares  shares in square order, SHARE_SIZE bytes each
 * @param[out] msgs       messages found, in order
 * @param[out] strError   reason for failure
 * @return false if the shares are malformed; msgs is left empty then
 */
bool ParseMessages(const std::vector<std::vector<unsigned char>>& rawShares,
                   std::vector<Message>& msgs,
                   std::string& strError);

} // namespace shares

#endif // DASQUARE_SHARES_SHARE_MERGER_H
