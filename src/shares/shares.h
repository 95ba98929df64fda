// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DASQUARE_SHARES_SHARES_H
#define DASQUARE_SHARES_SHARES_H

/**
 * @file shares.h
 * @brief Messages, shares and the share count of a message
 *
 * A message is laid out as uvarint(len) || payload over as many
 * MSG_SHARE_SIZE-byte share bodies as needed, each prefixed by the message's
 * namespace. MsgSharesUsed() is the single source of truth for how many
 * shares that takes; the splitter and the layout rules both call it.
 */

#include <shares/namespace_id.h>
#include <shares/share_params.h>

#include <cstdint>
#include <string>
#include <vector>

namespace shares {

/** An application message (blob) destined for the data square */
struct Message {
    /** Namespace the message is published under */
    NamespaceID nid;

    /** Raw message payload */
    std::vector<unsigned char> data;

    Message() {}
    Message(const NamespaceID& nidIn, std::vector<unsigned char> dataIn)
        : nid(nidIn), data(std::move(dataIn)) {}

    std::string ToString() const;

    bool operator==(const Message& other) const {
        return nid == other.nid && data == other.data;
    }
    bool operator!=(const Message& other) const { return !(*this == other); }
};

/** A share together with the namespace it was written under */
struct NamespacedShare {
    NamespaceID nid;

    /** SHARE_SIZE bytes: the namespace followed by the share body */
    std::vector<unsigned char> share;

    NamespacedShare() {}
    NamespacedShare(const NamespaceID& nidIn, std::vector<unsigned char> shareIn)
        : nid(nidIn), share(std::move(shareIn)) {}
};

typedef std::vector<NamespacedShare> NamespacedShares;

/** Strip the namespace bookkeeping and return the raw share bytes */
std::vector<std::vector<unsigned char>> RawShares(const NamespacedShares& nsShares);

/** Number of bytes uvarint encoding of x takes */
size_t DelimLen(uint64_t x);

/** Append the uvarint encoding of x to out */
void WriteUVarint(std::vector<unsigned char>& out, uint64_t x);

/**
 * Decode a uvarint from [begin, end).
 * @return number of bytes consumed, or 0 if the encoding is truncated or
 *         does not fit in 64 bits
 */
size_t ReadUVarint(const unsigned char* begin, const unsigned char* end, uint64_t& value);

/**
 * Number of shares a message with a payload of msgSize bytes occupies,
 * including the length prefix in its first share.
 */
uint32_t MsgSharesUsed(size_t msgSize);

/** Share counts of every message, in order */
std::vector<uint32_t> MsgShareLens(const std::vector<Message>& msgs);

/**
 * Check that a message may be placed in the square: non-empty payload and a
 * namespace outside the reserved range.
 */
bool CheckMessage(const Message& msg, std::string& strError);

} // namespace shares

#endif // DASQUARE_SHARES_SHARES_H
