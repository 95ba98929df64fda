// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DASQUARE_SHARES_NON_INTERACTIVE_DEFAULTS_H
#define DASQUARE_SHARES_NON_INTERACTIVE_DEFAULTS_H

/**
 * @file non_interactive_defaults.h
 * @brief Message placement in the data square under the non-interactive
 *        default rules
 *
 * A message of n shares starts at a multiple of the largest power of two
 * that is <= n, counted within the row it lands in. A message that cannot
 * start at such an index in the current row moves to the start of the next
 * row. This bounds the number of subtree roots needed to prove a message's
 * inclusion, so a verifier only needs the message length, its namespace and
 * its start index to find its shares.
 *
 * Every square size passed in must be a non-zero power of two and every
 * message share length must be non-zero; violations throw
 * std::invalid_argument.
 */

#include <shares/share_params.h>
#include <shares/shares.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shares {

/** True if v is a non-zero power of two */
bool IsPowerOfTwo(uint64_t v);

/** Smallest power of two >= v (1 for v == 0) */
uint64_t NextPowerOfTwo(uint64_t v);

/** Largest power of two <= v; v must be non-zero */
uint64_t NextLowestPowerOfTwo(uint64_t v);

/** Round cursor up to the next multiple of v; v must be non-zero */
uint64_t RoundUpBy(uint64_t cursor, uint64_t v);

/**
 * Find where a message of msgLen shares starts when the square is filled up
 * to cursor.
 *
 * @return the start index and whether the whole message fits in the row it
 *         starts in. When it does not, the start is either an aligned index
 *         in the current row that leaves room for at least
 *         NextLowestPowerOfTwo(msgLen) shares, or the start of the next row.
 */
std::pair<uint64_t, bool> NextAlignedPowerOfTwo(uint64_t cursor, uint64_t msgLen, uint64_t squareSize);

/** Dry-run placement of a list of messages */
struct MsgSharesLayout {
    /** Shares consumed from the initial cursor, padding included */
    uint64_t sharesUsed;

    /** Start index of every message, in input order */
    std::vector<uint32_t> indexes;

    MsgSharesLayout() : sharesUsed(0) {}
};

/**
 * Place messages of the given share lengths one after another starting at
 * cursor, without producing any shares. Throws std::overflow_error if a
 * start index does not fit in 32 bits.
 */
MsgSharesLayout MsgSharesUsedNIDefaults(uint64_t cursor, uint64_t squareSize,
                                        const std::vector<uint32_t>& msgShareLens);

/**
 * True if messages of the given share lengths, placed from cursor, end at or
 * before the last share of a squareSize x squareSize square.
 */
bool FitsInSquare(uint64_t cursor, uint64_t squareSize, const std::vector<uint32_t>& msgShareLens);

/**
 * @brief Outcome of splitting messages into shares
 *
 * On failure no shares or indexes are returned.
 */
struct SplitResult {
    bool success;

    /** Padding and message shares, SHARE_SIZE bytes each */
    std::vector<std::vector<unsigned char>> rawShares;

    /** The initial cursor followed by the start index of every message */
    std::vector<uint32_t> indexes;

    std::string error;

    /** Index into the input of the message that could not be placed */
    size_t failedMessage;

    SplitResult() : success(false), failedMessage(0) {}

    static SplitResult Success(std::vector<std::vector<unsigned char>> shares,
                               std::vector<uint32_t> idx);
    static SplitResult Failure(const std::string& err, size_t msgIndex);
};

/**
 * Split messages into shares following the non-interactive default rules,
 * emitting namespaced padding shares in the gaps alignment leaves.
 *
 * This is unbounded in that it does not stop once the square is full: the
 * result may hold more than squareSize^2 shares. Callers that prioritise
 * messages split everything and then drop the least prioritised messages
 * until the result fits. Fails if a message would start past row
 * squareSize, or if a start index does not fit in 32 bits.
 */
SplitResult SplitMessagesUsingNIDefaults(uint64_t cursor, uint64_t squareSize,
                                         const std::vector<Message>& msgs);

/**
 * Number of tail padding shares that fill a squareSize x squareSize square
 * after sharesUsed shares written from cursor; 0 when the square is already
 * full or overfull.
 */
uint64_t TailPaddingCount(uint64_t cursor, uint64_t sharesUsed, uint64_t squareSize);

/**
 * Smallest square size within params' bounds that holds messages of the
 * given share lengths placed from cursor.
 */
std::optional<uint64_t> EstimateSquareSize(uint64_t cursor,
                                           const std::vector<uint32_t>& msgShareLens,
                                           const SquareParams& params);

} // namespace shares

#endif // DASQUARE_SHARES_NON_INTERACTIVE_DEFAULTS_H
