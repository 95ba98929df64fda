// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share_merger.h>
#include <util.h>

#include <algorithm>

namespace shares {

bool ParseMessages(const std::vector<std::vector<unsigned char>>& rawShares,
                   std::vector<Message>& msgs,
                   std::string& strError)
{
    msgs.clear();
    std::vector<Message> found;

    size_t i = 0;
    while (i < rawShares.size()) {
        const std::vector<unsigned char>& first = rawShares[i];
        if (first.size() != SHARE_SIZE) {
            strError = strprintf("share %u has size %u, expected %u", i, first.size(), SHARE_SIZE);
            return false;
        }

        const NamespaceID nid(std::vector<unsigned char>(first.begin(), first.begin() + NAMESPACE_SIZE));
        const unsigned char* body = first.data() + NAMESPACE_SIZE;

        uint64_t msgLen = 0;
        size_t delimLen = ReadUVarint(body, body + MSG_SHARE_SIZE, msgLen);
        if (delimLen == 0) {
            strError = strprintf("share %u has a malformed length prefix", i);
            return false;
        }
        if (msgLen == 0) {
            // padding
            ++i;
            continue;
        }

        const size_t available = rawShares.size() - i;
        if (msgLen > available * MSG_SHARE_SIZE) {
            strError = strprintf("message at share %u declares %u bytes, only %u shares remain", i, msgLen, available);
            return false;
        }
        const uint32_t count = MsgSharesUsed(msgLen);
        if (count > available) {
            strError = strprintf("message at share %u needs %u shares, only %u remain", i, count, available);
            return false;
        }

        Message msg;
        msg.nid = nid;
        msg.data.reserve(msgLen);
        size_t remaining = msgLen;
        for (uint32_t j = 0; j < count; ++j) {
            const std::vector<unsigned char>& share = rawShares[i + j];
            if (share.size() != SHARE_SIZE) {
                strError = strprintf("share %u has size %u, expected %u", i + j, share.size(), SHARE_SIZE);
                return false;
            }
            if (!std::equal(nid.begin(), nid.end(), share.begin())) {
                strError = strprintf("share %u changes namespace inside the message starting at share %u", i + j, i);
                return false;
            }
            size_t offset = NAMESPACE_SIZE + (j == 0 ? delimLen : 0);
            size_t take = std::min(remaining, SHARE_SIZE - offset);
            msg.data.insert(msg.data.end(), share.begin() + offset, share.begin() + offset + take);
            remaining -= take;
        }

        LogPrint(DALog::SHARES, "ParseMessages: found %s at share %u\n", msg.ToString(), i);
        found.push_back(std::move(msg));
        i += count;
    }

    msgs.swap(found);
    return true;
}

} // namespace shares
