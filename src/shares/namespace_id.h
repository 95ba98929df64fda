// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DASQUARE_SHARES_NAMESPACE_ID_H
#define DASQUARE_SHARES_NAMESPACE_ID_H

#include <shares/share_params.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace shares {

/**
 * @brief Fixed-size namespace tag prefixed to every share
 *
 * Namespaces order shares inside the square: all shares of one namespace are
 * contiguous and namespaces appear in ascending byte order.
 */
class NamespaceID
{
public:
    NamespaceID() { m_data.fill(0); }

    /** Construct from exactly NAMESPACE_SIZE bytes; asserts on a size mismatch. */
    explicit NamespaceID(const std::vector<unsigned char>& vch);

    /** Construct from a big-endian integer value. */
    static NamespaceID FromUint64(uint64_t value);

    /**
     * Parse 2 * NAMESPACE_SIZE hex characters.
     * @return false (and leave out untouched) if str is not a valid namespace
     */
    static bool FromHex(const std::string& str, NamespaceID& out);

    bool IsNull() const;

    /**
     * Reserved namespaces are not available to messages: everything up to
     * MAX_RESERVED_NAMESPACE_ID plus the tail padding and parity namespaces.
     */
    bool IsReserved() const;

    std::string ToString() const;

    const unsigned char* begin() const { return m_data.data(); }
    const unsigned char* end() const { return m_data.data() + m_data.size(); }
    unsigned char* begin() { return m_data.data(); }
    unsigned char* end() { return m_data.data() + m_data.size(); }
    static constexpr size_t size() { return NAMESPACE_SIZE; }

    friend bool operator==(const NamespaceID& a, const NamespaceID& b) { return a.m_data == b.m_data; }
    friend bool operator!=(const NamespaceID& a, const NamespaceID& b) { return a.m_data != b.m_data; }
    friend bool operator<(const NamespaceID& a, const NamespaceID& b) { return a.m_data < b.m_data; }
    friend bool operator<=(const NamespaceID& a, const NamespaceID& b) { return a.m_data <= b.m_data; }

private:
    std::array<unsigned char, NAMESPACE_SIZE> m_data;
};

/** Namespace of the transaction shares at the start of the square */
extern const NamespaceID TX_NAMESPACE_ID;

/** Highest namespace reserved for protocol use */
extern const NamespaceID MAX_RESERVED_NAMESPACE_ID;

/** Namespace of the padding shares after the last message */
extern const NamespaceID TAIL_PADDING_NAMESPACE_ID;

/** Namespace of erasure-coded parity shares */
extern const NamespaceID PARITY_SHARES_NAMESPACE_ID;

} // namespace shares

#endif // DASQUARE_SHARES_NAMESPACE_ID_H
