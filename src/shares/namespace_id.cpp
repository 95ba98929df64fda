// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/namespace_id.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <cassert>

namespace shares {

const NamespaceID TX_NAMESPACE_ID = NamespaceID::FromUint64(1);
const NamespaceID MAX_RESERVED_NAMESPACE_ID = NamespaceID::FromUint64(255);
const NamespaceID TAIL_PADDING_NAMESPACE_ID = NamespaceID::FromUint64(0xFFFFFFFFFFFFFFFEULL);
const NamespaceID PARITY_SHARES_NAMESPACE_ID = NamespaceID::FromUint64(0xFFFFFFFFFFFFFFFFULL);

NamespaceID::NamespaceID(const std::vector<unsigned char>& vch)
{
    assert(vch.size() == NAMESPACE_SIZE);
    std::copy(vch.begin(), vch.end(), m_data.begin());
}

NamespaceID NamespaceID::FromUint64(uint64_t value)
{
    static_assert(NAMESPACE_SIZE == sizeof(uint64_t), "namespace must fit a uint64_t");
    NamespaceID nid;
    for (size_t i = 0; i < NAMESPACE_SIZE; ++i) {
        nid.m_data[NAMESPACE_SIZE - 1 - i] = static_cast<unsigned char>(value >> (8 * i));
    }
    return nid;
}

bool NamespaceID::FromHex(const std::string& str, NamespaceID& out)
{
    if (str.size() != 2 * NAMESPACE_SIZE || !IsHex(str)) {
        return false;
    }
    out = NamespaceID(ParseHex(str));
    return true;
}

bool NamespaceID::IsNull() const
{
    return std::all_of(m_data.begin(), m_data.end(), [](unsigned char c) { return c == 0; });
}

bool NamespaceID::IsReserved() const
{
    return *this <= MAX_RESERVED_NAMESPACE_ID ||
           *this == TAIL_PADDING_NAMESPACE_ID ||
           *this == PARITY_SHARES_NAMESPACE_ID;
}

std::string NamespaceID::ToString() const
{
    return HexStr(m_data.begin(), m_data.end());
}

} // namespace shares
