// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DASQUARE_CORE_IO_H
#define DASQUARE_CORE_IO_H

#include <shares/non_interactive_defaults.h>
#include <shares/share_params.h>
#include <shares/shares.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class UniValue;

// core_read.cpp
/**
 * Decode a message given as "<namespace hex>:<payload hex>".
 * The payload may be empty ("<namespace hex>:").
 */
bool DecodeHexMessage(const std::string& strArg, shares::Message& msg, std::string& strError);

/** DecodeHexMessage, additionally rejecting messages CheckMessage refuses. */
bool ParseMessageArg(const std::string& strArg, shares::Message& msg, std::string& strError);

/** Parse a non-negative starting share index. */
bool ParseCursor(const std::string& strCursor, uint64_t& cursor, std::string& strError);

/**
 * Pick the square width. When strSquareSize is set it must be a power of two
 * within params' bounds; otherwise the smallest square that holds the
 * messages is estimated, failing if even the largest one does not.
 */
bool ChooseSquareSize(const std::optional<std::string>& strSquareSize, uint64_t cursor,
                      const std::vector<uint32_t>& msgShareLens, const shares::SquareParams& params,
                      uint64_t& nSquareSize, std::string& strError);

// core_write.cpp
/**
 * JSON view of a split. nTailPadding tail padding shares are listed after
 * the split's own shares when fIncludeShares is set.
 */
UniValue SplitResultToUniv(uint64_t squareSize, uint64_t cursor, bool fFits,
                           const shares::SplitResult& result, uint64_t nTailPadding,
                           bool fIncludeShares);

#endif // DASQUARE_CORE_IO_H
