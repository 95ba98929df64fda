// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <shares/share_params.h>
#include <test/test_dasquare.h>
#include <utilstrencodings.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_HexStr)
{
    const std::vector<unsigned char> vch = {0x00, 0x0f, 0xa0, 0xff};
    BOOST_CHECK_EQUAL(HexStr(vch), "000fa0ff");
    BOOST_CHECK_EQUAL(HexStr(vch, true), "00 0f a0 ff");
    BOOST_CHECK_EQUAL(HexStr(vch.begin(), vch.begin()), "");
}

BOOST_AUTO_TEST_CASE(util_ParseHex)
{
    std::vector<unsigned char> result = ParseHex("000fa0ff");
    const std::vector<unsigned char> expected = {0x00, 0x0f, 0xa0, 0xff};
    BOOST_CHECK_EQUAL_COLLECTIONS(result.begin(), result.end(), expected.begin(), expected.end());

    // Spaces between bytes must be supported
    result = ParseHex("12 34 56 78");
    BOOST_CHECK(result.size() == 4 && result[0] == 0x12 && result[3] == 0x78);

    // Stop parsing at invalid value
    result = ParseHex("1234 invalid 1234");
    BOOST_CHECK(result.size() == 2 && result[0] == 0x12 && result[1] == 0x34);

    // Bytes above 0x7f are neither hex nor whitespace
    result = ParseHex("\xa0\xe9" "12");
    BOOST_CHECK(result.empty());
    BOOST_CHECK(!IsHex("12\xff"));

    BOOST_CHECK(IsHex("00"));
    BOOST_CHECK(IsHex("abcdefABCDEF0123"));
    BOOST_CHECK(!IsHex(""));
    BOOST_CHECK(!IsHex("0"));
    BOOST_CHECK(!IsHex("0x00"));
}

BOOST_AUTO_TEST_CASE(util_ParseInt64)
{
    int64_t n;
    BOOST_CHECK(ParseInt64("1234", &n) && n == 1234);
    BOOST_CHECK(ParseInt64("-1", &n) && n == -1);
    BOOST_CHECK(!ParseInt64("", &n));
    BOOST_CHECK(!ParseInt64(" 1", &n));
    BOOST_CHECK(!ParseInt64("1a", &n));
    BOOST_CHECK(!ParseInt64("99999999999999999999", &n));
    BOOST_CHECK(!ParseInt64("\xa0" "1", &n));
    BOOST_CHECK(!ParseInt64("1\xe9", &n));
}

class TestArgsManager : public ArgsManager
{
public:
    std::map<std::string, std::string>& GetMapArgs()
    {
        return mapArgs;
    }
    const std::map<std::string, std::vector<std::string>>& GetMapMultiArgs()
    {
        return mapMultiArgs;
    }
};

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    TestArgsManager testArgs;
    std::string error;
    const char* argv_test[] = {"-ignored", "-a", "-b", "-ccc=argument", "-ccc=multiple", "--d=e"};

    BOOST_CHECK(testArgs.ParseParameters(0, (char**)argv_test, error));
    BOOST_CHECK(testArgs.GetMapArgs().empty() && testArgs.GetMapMultiArgs().empty());

    BOOST_CHECK(testArgs.ParseParameters(6, (char**)argv_test, error));
    // expectation: -ignored is ignored (program name argument),
    // -a, -b and -ccc end up in map, -d ends up in map as -d.
    BOOST_CHECK(testArgs.GetMapArgs().size() == 4 && testArgs.GetMapMultiArgs().size() == 4);
    BOOST_CHECK(testArgs.IsArgSet("-a") && testArgs.IsArgSet("-b") && testArgs.IsArgSet("-ccc")
                && !testArgs.IsArgSet("f") && !testArgs.IsArgSet("-f"));
    BOOST_CHECK(testArgs.GetArg("-ccc", "") == "multiple");
    BOOST_CHECK(testArgs.GetArg("-d", "") == "e");
    BOOST_CHECK_EQUAL(testArgs.GetArgs("-ccc").size(), 2U);
    BOOST_CHECK(testArgs.GetArgs("-ccc")[0] == "argument");
    BOOST_CHECK(testArgs.GetArgs("-missing").empty());

    const char* argv_bad[] = {"ignored", "-a", "positional"};
    BOOST_CHECK(!testArgs.ParseParameters(3, (char**)argv_bad, error));
    BOOST_CHECK(!error.empty());
}

BOOST_AUTO_TEST_CASE(util_GetBoolArg)
{
    TestArgsManager testArgs;
    std::string error;
    const char* argv_test[] = {
        "ignored", "-a", "-nob", "-c=0", "-d=1", "-e=false", "-f=true", "-nog=0"};
    BOOST_CHECK(testArgs.ParseParameters(8, (char**)argv_test, error));

    // Each letter should be set.
    for (char opt : "abcdefg")
        BOOST_CHECK(testArgs.IsArgSet({'-', opt}) || !opt);

    BOOST_CHECK(testArgs.GetBoolArg("-a", false) == true);
    BOOST_CHECK(testArgs.GetBoolArg("-b", true) == false);
    BOOST_CHECK(testArgs.GetBoolArg("-c", true) == false);
    BOOST_CHECK(testArgs.GetBoolArg("-d", false) == true);
    BOOST_CHECK(testArgs.GetBoolArg("-e", true) == false);
    BOOST_CHECK(testArgs.GetBoolArg("-f", true) == false);
    // double negative
    BOOST_CHECK(testArgs.GetBoolArg("-g", false) == true);
    BOOST_CHECK(testArgs.GetBoolArg("-unset", true) == true);
}

BOOST_AUTO_TEST_CASE(util_GetArg)
{
    TestArgsManager testArgs;
    testArgs.GetMapArgs().clear();
    testArgs.GetMapArgs()["strtest1"] = "string...";
    testArgs.GetMapArgs()["inttest1"] = "12345";
    testArgs.GetMapArgs()["inttest2"] = "81985529216486895";
    BOOST_CHECK_EQUAL(testArgs.GetArg("strtest1", "default"), "string...");
    BOOST_CHECK_EQUAL(testArgs.GetArg("strtest2", "default"), "default");
    BOOST_CHECK_EQUAL(testArgs.GetArg("inttest1", -1), 12345);
    BOOST_CHECK_EQUAL(testArgs.GetArg("inttest2", -1), 81985529216486895LL);
    BOOST_CHECK_EQUAL(testArgs.GetArg("inttest3", -1), -1);

    BOOST_CHECK(testArgs.SoftSetBoolArg("-softbool", true));
    BOOST_CHECK(!testArgs.SoftSetBoolArg("-softbool", false));
    BOOST_CHECK(testArgs.GetBoolArg("-softbool", false));
    testArgs.ForceSetArg("-softbool", "0");
    BOOST_CHECK(!testArgs.GetBoolArg("-softbool", true));
}

BOOST_AUTO_TEST_CASE(util_LogCategories)
{
    uint32_t flag = 0;
    std::string str = "shares";
    BOOST_CHECK(GetLogCategory(&flag, &str));
    BOOST_CHECK_EQUAL(flag, (uint32_t)DALog::SHARES);

    str = "layout";
    BOOST_CHECK(GetLogCategory(&flag, &str));
    BOOST_CHECK_EQUAL(flag, (uint32_t)DALog::LAYOUT);

    str = "";
    BOOST_CHECK(GetLogCategory(&flag, &str));
    BOOST_CHECK_EQUAL(flag, (uint32_t)DALog::ALL);

    str = "bogus";
    BOOST_CHECK(!GetLogCategory(&flag, &str));
    BOOST_CHECK(!GetLogCategory(nullptr, &str));

    BOOST_CHECK_EQUAL(ListLogCategories(), "shares, layout");

    logCategories = DALog::NONE;
    BOOST_CHECK(!LogAcceptCategory(DALog::SHARES));
    logCategories |= DALog::LAYOUT;
    BOOST_CHECK(LogAcceptCategory(DALog::LAYOUT));
    BOOST_CHECK(!LogAcceptCategory(DALog::SHARES));
}

BOOST_AUTO_TEST_CASE(util_FormatISO8601DateTime)
{
    BOOST_CHECK_EQUAL(FormatISO8601DateTime(1317425777), "2011-09-30T23:36:17Z");
    BOOST_CHECK_EQUAL(FormatISO8601DateTime(0), "1970-01-01T00:00:00Z");
}

BOOST_AUTO_TEST_CASE(util_HelpMessage)
{
    BOOST_CHECK_EQUAL(HelpMessageGroup("Options:"), "Options:\n\n");
    BOOST_CHECK_EQUAL(HelpMessageOpt("-a", "Short"), "  -a\n       Short\n\n");

    const std::string wrapped = HelpMessageOpt("-b", std::string(60, 'x') + " " + std::string(20, 'y'));
    BOOST_CHECK_EQUAL(wrapped, "  -b\n       " + std::string(60, 'x') + "\n       " + std::string(20, 'y') + "\n\n");
}

BOOST_AUTO_TEST_CASE(square_params_selection)
{
    BOOST_CHECK_EQUAL(shares::GetSquareParams().strNetworkID, shares::NETWORK_REGTEST);

    shares::SelectSquareParams(shares::NETWORK_MAIN);
    BOOST_CHECK_EQUAL(shares::GetSquareParams().nMaxSquareSize, 128U);
    BOOST_CHECK_EQUAL(shares::GetSquareParams().MaxSquareShares(), 128U * 128U);

    shares::SelectSquareParams("unknown");
    BOOST_CHECK_EQUAL(shares::GetSquareParams().strNetworkID, shares::NETWORK_MAIN);

    gArgs.ForceSetArg("-regtest", "1");
    BOOST_CHECK_EQUAL(shares::NetworkFromCommandLine(), shares::NETWORK_REGTEST);
    gArgs.ForceSetArg("-testnet", "1");
    BOOST_CHECK_THROW(shares::NetworkFromCommandLine(), std::runtime_error);
    gArgs.ForceSetArg("-regtest", "0");
    BOOST_CHECK_EQUAL(shares::NetworkFromCommandLine(), shares::NETWORK_TESTNET);
}

BOOST_AUTO_TEST_SUITE_END()
