// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DASQUARE_SHARES_SHARE_PARAMS_H
#define DASQUARE_SHARES_SHARE_PARAMS_H

/**
 * @file share_params.h
 * @brief Share layout constants and network-specific square parameters
 *
 * The share and namespace sizes are consensus constants shared by every
 * network. The square bounds differ per network so that regtest can exercise
 * overflow paths with small squares.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace shares {

/** Size of a single share in bytes */
static constexpr size_t SHARE_SIZE = 256;

/** Size of the namespace prefix carried by every share */
static constexpr size_t NAMESPACE_SIZE = 8;

/** Payload capacity of a message share */
static constexpr size_t MSG_SHARE_SIZE = SHARE_SIZE - NAMESPACE_SIZE;

/** Upper bound of the varint length prefix on a message's first share */
static constexpr size_t MAX_DELIM_LEN = 10;

/**
 * Square parameters
 * These parameters are network-specific (mainnet/testnet/regtest)
 */
struct SquareParams {
    /** Network name these parameters belong to */
    std::string strNetworkID;

    /** Smallest square width a block may use (power of two) */
    uint32_t nMinSquareSize;

    /** Largest square width a block may use (power of two) */
    uint32_t nMaxSquareSize;

    /** Maximum number of shares in the original data square */
    uint64_t MaxSquareShares() const {
        return static_cast<uint64_t>(nMaxSquareSize) * nMaxSquareSize;
    }
};

/** Network names accepted by SelectSquareParams */
extern const std::string NETWORK_MAIN;
extern const std::string NETWORK_TESTNET;
extern const std::string NETWORK_REGTEST;

/**
 * Get square parameters for mainnet
 */
const SquareParams& MainnetSquareParams();

/**
 * Get square parameters for testnet
 */
const SquareParams& TestnetSquareParams();

/**
 * Get square parameters for regtest
 */
const SquareParams& RegtestSquareParams();

/**
 * Get the currently selected square parameters
 */
const SquareParams& GetSquareParams();

/**
 * Select square parameters by network name. Unknown names select mainnet.
 */
void SelectSquareParams(const std::string& network);

/**
 * Network name from the -testnet / -regtest flags in gArgs.
 * @throws std::runtime_error if both are set
 */
std::string NetworkFromCommandLine();

} // namespace shares

#endif // DASQUARE_SHARES_SHARE_PARAMS_H
