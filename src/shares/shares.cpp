// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/shares.h>
#include <util.h>

#include <cstddef>

namespace shares {

std::string Message::ToString() const
{
    return strprintf("Message(nid=%s, size=%u, shares=%u)", nid.ToString(), data.size(), MsgSharesUsed(data.size()));
}

std::vector<std::vector<unsigned char>> RawShares(const NamespacedShares& nsShares)
{
    std::vector<std::vector<unsigned char>> raw;
    raw.reserve(nsShares.size());
    for (const NamespacedShare& s : nsShares) {
        raw.push_back(s.share);
    }
    return raw;
}

size_t DelimLen(uint64_t x)
{
    size_t n = 1;
    while (x >= 0x80) {
        x >>= 7;
        ++n;
    }
    return n;
}

void WriteUVarint(std::vector<unsigned char>& out, uint64_t x)
{
    while (x >= 0x80) {
        out.push_back(static_cast<unsigned char>(x) | 0x80);
        x >>= 7;
    }
    out.push_back(static_cast<unsigned char>(x));
}

size_t ReadUVarint(const unsigned char* begin, const unsigned char* end, uint64_t& value)
{
    uint64_t x = 0;
    unsigned int shift = 0;
    for (const unsigned char* p = begin; p != end && p - begin < (ptrdiff_t)MAX_DELIM_LEN; ++p) {
        unsigned char b = *p;
        if (b < 0x80) {
            // the tenth byte may only carry the top bit of a uint64_t
            if (p - begin == (ptrdiff_t)MAX_DELIM_LEN - 1 && b > 1) {
                return 0;
            }
            value = x | (static_cast<uint64_t>(b) << shift);
            return static_cast<size_t>(p - begin) + 1;
        }
        x |= static_cast<uint64_t>(b & 0x7f) << shift;
        shift += 7;
    }
    return 0;
}

uint32_t MsgSharesUsed(size_t msgSize)
{
    // add the delimiter to the message size
    uint64_t adjusted = static_cast<uint64_t>(msgSize) + DelimLen(msgSize);
    uint64_t shareCount = adjusted / MSG_SHARE_SIZE;
    // increment the share count if the message overflows the last counted share
    if (adjusted % MSG_SHARE_SIZE != 0) {
        shareCount++;
    }
    return static_cast<uint32_t>(shareCount);
}

std::vector<uint32_t> MsgShareLens(const std::vector<Message>& msgs)
{
    std::vector<uint32_t> lens;
    lens.reserve(msgs.size());
    for (const Message& msg : msgs) {
        lens.push_back(MsgSharesUsed(msg.data.size()));
    }
    return lens;
}

bool CheckMessage(const Message& msg, std::string& strError)
{
    if (msg.data.empty()) {
        strError = "message payload is empty";
        return false;
    }
    if (msg.nid.IsReserved()) {
        strError = strprintf("namespace %s is reserved", msg.nid.ToString());
        return false;
    }
    return true;
}

} // namespace shares
