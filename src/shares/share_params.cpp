// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share_params.h>
#include <util.h>

#include <stdexcept>

namespace shares {

const std::string NETWORK_MAIN = "main";
const std::string NETWORK_TESTNET = "test";
const std::string NETWORK_REGTEST = "regtest";

static SquareParams CreateMainnetParams()
{
    SquareParams params;
    params.strNetworkID = NETWORK_MAIN;
    params.nMinSquareSize = 1;
    params.nMaxSquareSize = 128;
    return params;
}

static SquareParams CreateTestnetParams()
{
    SquareParams params;
    params.strNetworkID = NETWORK_TESTNET;
    params.nMinSquareSize = 1;
    params.nMaxSquareSize = 128;
    return params;
}

static SquareParams CreateRegtestParams()
{
    SquareParams params;
    params.strNetworkID = NETWORK_REGTEST;
    params.nMinSquareSize = 1;
    params.nMaxSquareSize = 8;
    return params;
}

static const SquareParams mainnetSquareParams = CreateMainnetParams();
static const SquareParams testnetSquareParams = CreateTestnetParams();
static const SquareParams regtestSquareParams = CreateRegtestParams();

static const SquareParams* pCurrentSquareParams = &mainnetSquareParams;

const SquareParams& MainnetSquareParams()
{
    return mainnetSquareParams;
}

const SquareParams& TestnetSquareParams()
{
    return testnetSquareParams;
}

const SquareParams& RegtestSquareParams()
{
    return regtestSquareParams;
}

const SquareParams& GetSquareParams()
{
    return *pCurrentSquareParams;
}

void SelectSquareParams(const std::string& network)
{
    if (network == NETWORK_MAIN) {
        pCurrentSquareParams = &mainnetSquareParams;
    } else if (network == NETWORK_TESTNET) {
        pCurrentSquareParams = &testnetSquareParams;
    } else if (network == NETWORK_REGTEST) {
        pCurrentSquareParams = &regtestSquareParams;
    } else {
        LogPrintf("Unknown network %s, using main square parameters\n", network);
        pCurrentSquareParams = &mainnetSquareParams;
    }
}

std::string NetworkFromCommandLine()
{
    bool fRegTest = gArgs.GetBoolArg("-regtest", false);
    bool fTestNet = gArgs.GetBoolArg("-testnet", false);

    if (fTestNet && fRegTest)
        throw std::runtime_error("Invalid combination of -regtest and -testnet.");
    if (fRegTest)
        return NETWORK_REGTEST;
    if (fTestNet)
        return NETWORK_TESTNET;
    return NETWORK_MAIN;
}

} // namespace shares
