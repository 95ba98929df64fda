// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <core_io.h>

#include <util.h>
#include <utilstrencodings.h>

#include <utility>

bool DecodeHexMessage(const std::string& strArg, shares::Message& msg, std::string& strError)
{
    size_t pos = strArg.find(':');
    if (pos == std::string::npos) {
        strError = strprintf("message '%s' is not of the form <namespace>:<payload>", strArg);
        return false;
    }

    const std::string strNid = strArg.substr(0, pos);
    const std::string strData = strArg.substr(pos + 1);

    shares::NamespaceID nid;
    if (!shares::NamespaceID::FromHex(strNid, nid)) {
        strError = strprintf("invalid namespace '%s', expected %u hex characters", strNid, 2 * shares::NAMESPACE_SIZE);
        return false;
    }
    if (!strData.empty() && !IsHex(strData)) {
        strError = strprintf("invalid message payload hex '%s'", strData);
        return false;
    }

    msg = shares::Message(nid, ParseHex(strData));
    return true;
}

bool ParseMessageArg(const std::string& strArg, shares::Message& msg, std::string& strError)
{
    shares::Message decoded;
    if (!DecodeHexMessage(strArg, decoded, strError) || !shares::CheckMessage(decoded, strError)) {
        return false;
    }
    msg = std::move(decoded);
    return true;
}

bool ParseCursor(const std::string& strCursor, uint64_t& cursor, std::string& strError)
{
    int64_t n = 0;
    if (!ParseInt64(strCursor, &n) || n < 0) {
        strError = strprintf("invalid cursor '%s', expected a non-negative share index", strCursor);
        return false;
    }
    cursor = (uint64_t)n;
    return true;
}

bool ChooseSquareSize(const std::optional<std::string>& strSquareSize, uint64_t cursor,
                      const std::vector<uint32_t>& msgShareLens, const shares::SquareParams& params,
                      uint64_t& nSquareSize, std::string& strError)
{
    if (!strSquareSize) {
        std::optional<uint64_t> estimate = shares::EstimateSquareSize(cursor, msgShareLens, params);
        if (!estimate) {
            strError = strprintf("messages do not fit in the largest square (%u) on %s",
                                 params.nMaxSquareSize, params.strNetworkID);
            return false;
        }
        nSquareSize = *estimate;
        return true;
    }

    int64_t n = 0;
    if (!ParseInt64(*strSquareSize, &n) || n <= 0 || !shares::IsPowerOfTwo((uint64_t)n)) {
        strError = strprintf("invalid square size '%s', must be a power of two", *strSquareSize);
        return false;
    }
    if ((uint64_t)n < params.nMinSquareSize || (uint64_t)n > params.nMaxSquareSize) {
        strError = strprintf("square size %d outside [%u, %u] on %s", n,
                             params.nMinSquareSize, params.nMaxSquareSize, params.strNetworkID);
        return false;
    }
    nSquareSize = (uint64_t)n;
    return true;
}
