// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <core_io.h>
#include <shares/non_interactive_defaults.h>
#include <shares/share_params.h>
#include <test/test_dasquare.h>

#include <univalue.h>

#include <boost/test/unit_test.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace shares;

BOOST_FIXTURE_TEST_SUITE(core_io_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(decode_hex_message)
{
    Message msg;
    std::string strError;

    BOOST_CHECK(DecodeHexMessage("0000000000000100:deadbeef", msg, strError));
    BOOST_CHECK(msg.nid == NamespaceID::FromUint64(0x100));
    const std::vector<unsigned char> expected = {0xde, 0xad, 0xbe, 0xef};
    BOOST_CHECK(msg.data == expected);

    BOOST_CHECK(DecodeHexMessage("0000000000000100:", msg, strError));
    BOOST_CHECK(msg.data.empty());

    BOOST_CHECK(!DecodeHexMessage("0000000000000100", msg, strError));
    BOOST_CHECK(!strError.empty());
    BOOST_CHECK(!DecodeHexMessage("00000100:deadbeef", msg, strError));
    BOOST_CHECK(!DecodeHexMessage("0000000000000100:xyz", msg, strError));
    BOOST_CHECK(!DecodeHexMessage("0000000000000100:abc", msg, strError));
}

BOOST_AUTO_TEST_CASE(split_result_to_univ)
{
    std::vector<Message> msgs;
    msgs.emplace_back(NamespaceID::FromUint64(0x100), std::vector<unsigned char>(10, 0x01));
    msgs.emplace_back(NamespaceID::FromUint64(0x101), std::vector<unsigned char>(300, 0x02));

    SplitResult result = SplitMessagesUsingNIDefaults(0, 4, msgs);
    BOOST_REQUIRE(result.success);

    UniValue out = SplitResultToUniv(4, 0, true, result, 12, true);
    BOOST_CHECK_EQUAL(out["squaresize"].get_int64(), 4);
    BOOST_CHECK_EQUAL(out["cursor"].get_int64(), 0);
    BOOST_CHECK_EQUAL(out["sharesused"].get_int64(), 4);
    BOOST_CHECK_EQUAL(out["tailpadding"].get_int64(), 12);
    BOOST_CHECK(out["fits"].get_bool());

    const UniValue& indexes = out["indexes"];
    BOOST_REQUIRE_EQUAL(indexes.size(), 2U);
    BOOST_CHECK_EQUAL(indexes[0].get_int64(), 0);
    BOOST_CHECK_EQUAL(indexes[1].get_int64(), 2);

    const UniValue& sharesArr = out["shares"];
    BOOST_REQUIRE_EQUAL(sharesArr.size(), 16U);
    BOOST_CHECK_EQUAL(sharesArr[0].get_str().size(), 2 * SHARE_SIZE);
    BOOST_CHECK_EQUAL(sharesArr[0].get_str().substr(0, 18), "00000000000001000a");
    BOOST_CHECK_EQUAL(sharesArr[15].get_str().substr(0, 16), "fffffffffffffffe");

    UniValue noShares = SplitResultToUniv(4, 0, true, result, 0, false);
    BOOST_CHECK(noShares["shares"].isNull());
}

BOOST_AUTO_TEST_CASE(parse_message_arg)
{
    Message msg;
    std::string strError;

    BOOST_CHECK(ParseMessageArg("0000000000000100:deadbeef", msg, strError));
    BOOST_CHECK(msg.nid == NamespaceID::FromUint64(0x100));
    BOOST_CHECK_EQUAL(msg.data.size(), 4U);

    // empty payloads decode but are not placeable
    BOOST_CHECK(!ParseMessageArg("0000000000000100:", msg, strError));
    BOOST_CHECK_EQUAL(strError, "message payload is empty");

    BOOST_CHECK(!ParseMessageArg("0000000000000001:aa", msg, strError));
    BOOST_CHECK(strError.find("reserved") != std::string::npos);
    BOOST_CHECK(!ParseMessageArg("00000000000000ff:aa", msg, strError));

    // failures leave the output untouched
    BOOST_CHECK(msg.nid == NamespaceID::FromUint64(0x100));
    BOOST_CHECK_EQUAL(msg.data.size(), 4U);

    BOOST_CHECK(!ParseMessageArg("nonsense", msg, strError));
}

BOOST_AUTO_TEST_CASE(parse_cursor)
{
    uint64_t cursor = 0;
    std::string strError;

    BOOST_CHECK(ParseCursor("0", cursor, strError));
    BOOST_CHECK_EQUAL(cursor, 0U);
    BOOST_CHECK(ParseCursor("17", cursor, strError));
    BOOST_CHECK_EQUAL(cursor, 17U);

    BOOST_CHECK(!ParseCursor("-1", cursor, strError));
    BOOST_CHECK(!strError.empty());
    BOOST_CHECK(!ParseCursor("", cursor, strError));
    BOOST_CHECK(!ParseCursor("12abc", cursor, strError));
    BOOST_CHECK_EQUAL(cursor, 17U);
}

BOOST_AUTO_TEST_CASE(choose_square_size)
{
    const SquareParams& regtest = RegtestSquareParams();
    const SquareParams& mainnet = MainnetSquareParams();
    uint64_t squareSize = 0;
    std::string strError;

    // estimated: two single-share messages need a 2x2 square
    BOOST_CHECK(ChooseSquareSize(std::nullopt, 0, {1, 1}, regtest, squareSize, strError));
    BOOST_CHECK_EQUAL(squareSize, 2U);
    BOOST_CHECK(ChooseSquareSize(std::nullopt, 0, {}, regtest, squareSize, strError));
    BOOST_CHECK_EQUAL(squareSize, 1U);

    // 65 shares exceed the largest regtest square but fit a 16-wide one on main
    BOOST_CHECK(!ChooseSquareSize(std::nullopt, 0, {65}, regtest, squareSize, strError));
    BOOST_CHECK(strError.find("largest square") != std::string::npos);
    BOOST_CHECK(ChooseSquareSize(std::nullopt, 0, {65}, mainnet, squareSize, strError));
    BOOST_CHECK_EQUAL(squareSize, 16U);

    // explicit: used as given, even when the messages do not fit
    BOOST_CHECK(ChooseSquareSize(std::string("4"), 0, {65}, regtest, squareSize, strError));
    BOOST_CHECK_EQUAL(squareSize, 4U);
    BOOST_CHECK(ChooseSquareSize(std::string("8"), 0, {}, regtest, squareSize, strError));
    BOOST_CHECK_EQUAL(squareSize, 8U);

    BOOST_CHECK(!ChooseSquareSize(std::string("3"), 0, {}, regtest, squareSize, strError));
    BOOST_CHECK(strError.find("power of two") != std::string::npos);
    BOOST_CHECK(!ChooseSquareSize(std::string("0"), 0, {}, regtest, squareSize, strError));
    BOOST_CHECK(!ChooseSquareSize(std::string("-4"), 0, {}, regtest, squareSize, strError));
    BOOST_CHECK(!ChooseSquareSize(std::string(""), 0, {}, regtest, squareSize, strError));
    BOOST_CHECK(!ChooseSquareSize(std::string("four"), 0, {}, regtest, squareSize, strError));

    // a valid power of two outside the network's bounds
    BOOST_CHECK(!ChooseSquareSize(std::string("16"), 0, {}, regtest, squareSize, strError));
    BOOST_CHECK(strError.find("outside") != std::string::npos);
    BOOST_CHECK(ChooseSquareSize(std::string("16"), 0, {}, mainnet, squareSize, strError));
    BOOST_CHECK(!ChooseSquareSize(std::string("256"), 0, {}, mainnet, squareSize, strError));
    BOOST_CHECK_EQUAL(squareSize, 16U);
}

BOOST_AUTO_TEST_CASE(tail_padding_count)
{
    BOOST_CHECK_EQUAL(TailPaddingCount(0, 0, 4), 16U);
    BOOST_CHECK_EQUAL(TailPaddingCount(0, 4, 4), 12U);
    BOOST_CHECK_EQUAL(TailPaddingCount(3, 5, 4), 8U);
    BOOST_CHECK_EQUAL(TailPaddingCount(0, 16, 4), 0U);

    // an overfull or fully skipped square gets no tail padding
    BOOST_CHECK_EQUAL(TailPaddingCount(0, 20, 4), 0U);
    BOOST_CHECK_EQUAL(TailPaddingCount(20, 0, 4), 0U);
    BOOST_CHECK_EQUAL(TailPaddingCount(10, 6, 4), 0U);

    BOOST_CHECK_THROW(TailPaddingCount(0, 0, 3), std::invalid_argument);

    // filling a split square brings it to exactly squareSize^2 shares
    std::vector<Message> msgs;
    msgs.emplace_back(NamespaceID::FromUint64(0x100), std::vector<unsigned char>(10, 0x01));
    SplitResult result = SplitMessagesUsingNIDefaults(3, 4, msgs);
    BOOST_REQUIRE(result.success);
    const uint64_t nTail = TailPaddingCount(3, result.rawShares.size(), 4);
    BOOST_CHECK_EQUAL(nTail, 12U);

    UniValue out = SplitResultToUniv(4, 3, true, result, nTail, true);
    BOOST_CHECK_EQUAL(out["shares"].size(), 13U);
    BOOST_CHECK_EQUAL(3 + out["shares"].size(), 16U);
}

BOOST_AUTO_TEST_SUITE_END()
