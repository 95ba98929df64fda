// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <core_io.h>

#include <shares/share_splitter.h>
#include <utilstrencodings.h>

#include <univalue.h>

UniValue SplitResultToUniv(uint64_t squareSize, uint64_t cursor, bool fFits,
                           const shares::SplitResult& result, uint64_t nTailPadding,
                           bool fIncludeShares)
{
    UniValue entry(UniValue::VOBJ);
    entry.pushKV("squaresize", squareSize);
    entry.pushKV("cursor", cursor);
    entry.pushKV("sharesused", (uint64_t)result.rawShares.size());
    entry.pushKV("tailpadding", nTailPadding);
    entry.pushKV("fits", fFits);

    // the first entry is the initial cursor, not a message
    UniValue indexes(UniValue::VARR);
    for (size_t i = 1; i < result.indexes.size(); ++i) {
        indexes.push_back((uint64_t)result.indexes[i]);
    }
    entry.pushKV("indexes", indexes);

    if (fIncludeShares) {
        UniValue sharesArr(UniValue::VARR);
        for (const std::vector<unsigned char>& share : result.rawShares) {
            sharesArr.push_back(HexStr(share));
        }
        for (const shares::NamespacedShare& tail : shares::TailPaddedShares(static_cast<uint32_t>(nTailPadding))) {
            sharesArr.push_back(HexStr(tail.share));
        }
        entry.pushKV("shares", sharesArr);
    }

    return entry;
}
