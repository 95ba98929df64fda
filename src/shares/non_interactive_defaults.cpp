// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/non_interactive_defaults.h>
#include <shares/share_splitter.h>
#include <util.h>

#include <limits>
#include <stdexcept>

namespace shares {

/** Keeps squareSize^2 and every cursor comfortably inside 64 bits */
static constexpr uint64_t MAX_SQUARE_SIZE_BOUND = uint64_t{1} << 31;

static void CheckSquareSize(uint64_t squareSize)
{
    if (!IsPowerOfTwo(squareSize) || squareSize > MAX_SQUARE_SIZE_BOUND) {
        throw std::invalid_argument(strprintf("square size %u is not a power of two in [1, 2^31]", squareSize));
    }
}

static bool IndexFits(uint64_t cursor)
{
    return cursor <= std::numeric_limits<uint32_t>::max();
}

static uint32_t CheckedIndex(uint64_t cursor)
{
    if (!IndexFits(cursor)) {
        throw std::overflow_error(strprintf("share index %u does not fit in 32 bits", cursor));
    }
    return static_cast<uint32_t>(cursor);
}

bool IsPowerOfTwo(uint64_t v)
{
    return v != 0 && (v & (v - 1)) == 0;
}

uint64_t NextPowerOfTwo(uint64_t v)
{
    uint64_t k = 1;
    while (k < v) {
        k <<= 1;
    }
    return k;
}

uint64_t NextLowestPowerOfTwo(uint64_t v)
{
    if (v == 0) {
        throw std::invalid_argument("NextLowestPowerOfTwo: zero has no lower power of two");
    }
    uint64_t c = NextPowerOfTwo(v);
    if (c == v) {
        return c;
    }
    return c / 2;
}

uint64_t RoundUpBy(uint64_t cursor, uint64_t v)
{
    if (v == 0) {
        throw std::invalid_argument("RoundUpBy: interval must be non-zero");
    }
    if (cursor % v == 0) {
        return cursor;
    }
    return ((cursor / v) + 1) * v;
}

std::pair<uint64_t, bool> NextAlignedPowerOfTwo(uint64_t cursor, uint64_t msgLen, uint64_t squareSize)
{
    CheckSquareSize(squareSize);
    if (msgLen == 0) {
        throw std::invalid_argument("NextAlignedPowerOfTwo: message share length must be non-zero");
    }

    // at the beginning of a row every message is aligned
    if (cursor % squareSize == 0) {
        return {cursor, true};
    }

    const uint64_t nextLowest = NextLowestPowerOfTwo(msgLen);
    const uint64_t endOfCurrentRow = ((cursor / squareSize) + 1) * squareSize;
    cursor = RoundUpBy(cursor, nextLowest);

    // the entire message fits in this row
    if (cursor + msgLen <= endOfCurrentRow) {
        return {cursor, true};
    }
    // only a portion of the message fits in this row
    if (cursor + nextLowest <= endOfCurrentRow) {
        return {cursor, false};
    }
    // none of the message fits on this row, so start at the next one
    return {endOfCurrentRow, false};
}

MsgSharesLayout MsgSharesUsedNIDefaults(uint64_t cursor, uint64_t squareSize,
                                        const std::vector<uint32_t>& msgShareLens)
{
    CheckSquareSize(squareSize);

    MsgSharesLayout layout;
    layout.indexes.reserve(msgShareLens.size());

    const uint64_t start = cursor;
    for (uint32_t msgLen : msgShareLens) {
        cursor = NextAlignedPowerOfTwo(cursor, msgLen, squareSize).first;
        layout.indexes.push_back(CheckedIndex(cursor));
        cursor += msgLen;
    }
    layout.sharesUsed = cursor - start;
    return layout;
}

bool FitsInSquare(uint64_t cursor, uint64_t squareSize, const std::vector<uint32_t>& msgShareLens)
{
    CheckSquareSize(squareSize);

    // with no messages, fitting only depends on the cursor
    if (msgShareLens.empty() && cursor / squareSize <= squareSize) {
        return true;
    }
    MsgSharesLayout layout = MsgSharesUsedNIDefaults(cursor, squareSize, msgShareLens);
    return cursor + layout.sharesUsed <= squareSize * squareSize;
}

SplitResult SplitResult::Success(std::vector<std::vector<unsigned char>> shares,
                                 std::vector<uint32_t> idx)
{
    SplitResult result;
    result.success = true;
    result.rawShares = std::move(shares);
    result.indexes = std::move(idx);
    return result;
}

SplitResult SplitResult::Failure(const std::string& err, size_t msgIndex)
{
    SplitResult result;
    result.success = false;
    result.error = err;
    result.failedMessage = msgIndex;
    return result;
}

SplitResult SplitMessagesUsingNIDefaults(uint64_t cursor, uint64_t squareSize,
                                         const std::vector<Message>& msgs)
{
    CheckSquareSize(squareSize);

    const uint64_t start = cursor;

    // slot 0 holds the initial cursor, filled in once the layout succeeded
    std::vector<uint32_t> indexes;
    indexes.reserve(msgs.size() + 1);
    indexes.push_back(0);

    MessageShareSplitter splitter;
    for (size_t i = 0; i < msgs.size(); ++i) {
        const Message& msg = msgs[i];

        const uint64_t row = cursor / squareSize;
        if (row > squareSize) {
            LogPrint(DALog::LAYOUT, "SplitMessagesUsingNIDefaults: message %u would start in row %u of a %u-wide square\n",
                     i, row, squareSize);
            return SplitResult::Failure(
                strprintf("failure to split messages: square size %u too small (message %u starts in row %u)",
                          squareSize, i, row),
                i);
        }

        const uint32_t msgShares = MsgSharesUsed(msg.data.size());
        const uint64_t nextCursor = NextAlignedPowerOfTwo(cursor, msgShares, squareSize).first;
        if (!IndexFits(nextCursor)) {
            return SplitResult::Failure(
                strprintf("failure to split messages: message %u start index %u does not fit in 32 bits",
                          i, nextCursor),
                i);
        }

        splitter.WriteNamespacedPaddedShares(static_cast<uint32_t>(nextCursor - cursor), msg.nid);
        splitter.Write(msg);

        LogPrint(DALog::LAYOUT, "SplitMessagesUsingNIDefaults: message %u (%u shares) at %u, %u padding shares\n",
                 i, msgShares, nextCursor, nextCursor - cursor);

        indexes.push_back(static_cast<uint32_t>(nextCursor));
        cursor = nextCursor + msgShares;
    }

    // any message start is >= the initial cursor, so this only trips without messages
    if (!IndexFits(start)) {
        return SplitResult::Failure(
            strprintf("failure to split messages: initial cursor %u does not fit in 32 bits", start),
            0);
    }
    indexes[0] = static_cast<uint32_t>(start);

    return SplitResult::Success(RawShares(splitter.Export()), std::move(indexes));
}

uint64_t TailPaddingCount(uint64_t cursor, uint64_t sharesUsed, uint64_t squareSize)
{
    CheckSquareSize(squareSize);

    const uint64_t capacity = squareSize * squareSize;
    if (cursor >= capacity || sharesUsed >= capacity - cursor) {
        return 0;
    }
    return capacity - cursor - sharesUsed;
}

std::optional<uint64_t> EstimateSquareSize(uint64_t cursor,
                                           const std::vector<uint32_t>& msgShareLens,
                                           const SquareParams& params)
{
    for (uint64_t squareSize = params.nMinSquareSize; squareSize <= params.nMaxSquareSize; squareSize *= 2) {
        if (FitsInSquare(cursor, squareSize, msgShareLens)) {
            LogPrint(DALog::LAYOUT, "EstimateSquareSize: %u messages fit a %u-wide square\n",
                     msgShareLens.size(), squareSize);
            return squareSize;
        }
    }
    return std::nullopt;
}

} // namespace shares
