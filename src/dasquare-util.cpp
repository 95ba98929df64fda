// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <core_io.h>
#include <shares/non_interactive_defaults.h>
#include <shares/share_params.h>
#include <shares/shares.h>
#include <util.h>

#include <univalue.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

static const int CONTINUE_EXECUTION = -1;

static const bool DEFAULT_FILL_SQUARE = false;
static const bool DEFAULT_PRINT_SHARES = true;

static std::string HelpMessageUtil()
{
    const shares::SquareParams& mainParams = shares::MainnetSquareParams();

    std::string strUsage = "dasquare-util: lay out messages in a data square\n\n";
    strUsage += "Usage:  dasquare-util [options] -msg=<namespace>:<payload> [-msg=...]\n\n";

    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-msg=<namespace>:<payload>", strprintf("Message to place, as %u hex characters of namespace and a hex payload. Repeat for several messages; they are placed in the given order", 2 * shares::NAMESPACE_SIZE));
    strUsage += HelpMessageOpt("-squaresize=<n>", strprintf("Square width, a power of two (default: smallest that fits, at most %u on main)", mainParams.nMaxSquareSize));
    strUsage += HelpMessageOpt("-cursor=<n>", "Share index the first message may start at (default: 0)");
    strUsage += HelpMessageOpt("-fillsquare", strprintf("Append tail padding shares up to the square's capacity (default: %u)", DEFAULT_FILL_SQUARE));
    strUsage += HelpMessageOpt("-noshares", "Leave the raw shares out of the output");

    strUsage += HelpMessageGroup("Chain selection options:");
    strUsage += HelpMessageOpt("-testnet", "Use the test chain square parameters");
    strUsage += HelpMessageOpt("-regtest", "Use the regression test square parameters");

    strUsage += HelpMessageGroup("Debugging options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", "Also append log output to <file>");
    strUsage += HelpMessageOpt("-logtimestamps", "Prepend debug output with timestamp (default: 0)");
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to stderr (default: 1)");

    return strUsage;
}

static void InitLogging()
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", true);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", false);

    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        if (std::none_of(categories.begin(), categories.end(),
            [](std::string cat){return cat == "0" || cat == "none";})) {
            for (const auto& cat : categories) {
                uint32_t flag = 0;
                if (!GetLogCategory(&flag, &cat)) {
                    LogPrintf("Unsupported logging category -debug=%s.\n", cat);
                    continue;
                }
                logCategories |= flag;
            }
        }
    }

    if (gArgs.IsArgSet("-debuglogfile")) {
        const std::string path = gArgs.GetArg("-debuglogfile", "");
        if (!OpenDebugLog(path)) {
            throw std::runtime_error(strprintf("Could not open debug log file %s", path));
        }
    }
}

static int AppInitUtil(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    // Check for -testnet or -regtest parameter (GetSquareParams() calls are only valid after this clause)
    try {
        shares::SelectSquareParams(shares::NetworkFromCommandLine());
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    if (argc < 2 || HelpRequested(gArgs)) {
        fprintf(stdout, "%s", HelpMessageUtil().c_str());
        if (argc < 2) {
            fprintf(stderr, "Error: too few parameters\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    InitLogging();
    return CONTINUE_EXECUTION;
}

static int CommandLineUtil()
{
    std::string strError;

    std::vector<shares::Message> msgs;
    for (const std::string& strMsg : gArgs.GetArgs("-msg")) {
        shares::Message msg;
        if (!ParseMessageArg(strMsg, msg, strError)) {
            throw std::runtime_error(strprintf("-msg=%s: %s", strMsg, strError));
        }
        msgs.push_back(std::move(msg));
    }

    uint64_t cursor = 0;
    if (!ParseCursor(gArgs.GetArg("-cursor", "0"), cursor, strError)) {
        throw std::runtime_error(strError);
    }

    const std::vector<uint32_t> msgShareLens = shares::MsgShareLens(msgs);
    std::optional<std::string> strSquareSize;
    if (gArgs.IsArgSet("-squaresize")) {
        strSquareSize = gArgs.GetArg("-squaresize", "");
    }
    uint64_t squareSize = 0;
    if (!ChooseSquareSize(strSquareSize, cursor, msgShareLens, shares::GetSquareParams(), squareSize, strError)) {
        throw std::runtime_error(strError);
    }

    shares::SplitResult result = shares::SplitMessagesUsingNIDefaults(cursor, squareSize, msgs);
    if (!result.success) {
        throw std::runtime_error(result.error);
    }
    const bool fFits = shares::FitsInSquare(cursor, squareSize, msgShareLens);

    uint64_t nTailPadding = 0;
    if (gArgs.GetBoolArg("-fillsquare", DEFAULT_FILL_SQUARE)) {
        nTailPadding = shares::TailPaddingCount(cursor, result.rawShares.size(), squareSize);
    }

    LogPrint(DALog::LAYOUT, "dasquare-util: %u messages in a %u-wide square, %u shares, fits=%d\n",
             msgs.size(), squareSize, result.rawShares.size(), fFits);

    UniValue out = SplitResultToUniv(squareSize, cursor, fFits, result, nTailPadding,
                                     gArgs.GetBoolArg("-shares", DEFAULT_PRINT_SHARES));
    fprintf(stdout, "%s\n", out.write(2).c_str());
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try {
        int ret = AppInitUtil(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    int ret = EXIT_FAILURE;
    try {
        ret = CommandLineUtil();
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        ret = EXIT_FAILURE;
    }
    CloseDebugLog();
    return ret;
}
