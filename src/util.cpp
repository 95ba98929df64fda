// Copyright (c) 2024 The dasquare developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <utilstrencodings.h>

#include <chrono>
#include <cstdio>
#include <ctime>

bool fPrintToConsole = false;
bool fLogTimestamps = false;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

ArgsManager gArgs;

/**
 * LogPrintf() has been broken a couple of times now
 * by well-meaning people adding mutexes in the most straightforward way.
 * It breaks because it may be called by global destructors during shutdown.
 * Since the order of destruction of static/global objects is undefined,
 * the mutex and file pointer are allocated on the heap and never freed.
 */
static std::mutex* mutexDebugLog = new std::mutex();
static FILE* fileout = nullptr;

/**
 * fStartedNewLine is a state variable held by the calling context that will
 * suppress printing of the timestamp when multiple calls are made that don't
 * end in a newline. Initialize it to true, and hold it, in the calling context.
 */
static std::atomic_bool fStartedNewLine(true);

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {DALog::NONE, "0"},
    {DALog::NONE, "none"},
    {DALog::SHARES, "shares"},
    {DALog::LAYOUT, "layout"},
    {DALog::ALL, "1"},
    {DALog::ALL, "all"},
};

bool GetLogCategory(uint32_t* f, const std::string* str)
{
    if (f && str) {
        if (*str == "") {
            *f = DALog::ALL;
            return true;
        }
        for (const CLogCategoryDesc& category_desc : LogCategories) {
            if (category_desc.category == *str) {
                *f = category_desc.flag;
                return true;
            }
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != DALog::NONE && category_desc.flag != DALog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

std::string FormatISO8601DateTime(int64_t nTime)
{
    struct tm ts;
    time_t time_val = nTime;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }
    return strprintf("%04i-%02i-%02iT%02i:%02i:%02iZ", ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

static std::string LogTimestampStr(const std::string& str, std::atomic_bool* fStartedNewLine)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (*fStartedNewLine) {
        int64_t nTimeMicros = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        strStamped = FormatISO8601DateTime(nTimeMicros / 1000000);
        strStamped.pop_back();
        strStamped += strprintf(".%06dZ", nTimeMicros % 1000000);
        strStamped += ' ' + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size() - 1] == '\n')
        *fStartedNewLine = true;
    else
        *fStartedNewLine = false;

    return strStamped;
}

bool OpenDebugLog(const std::string& path)
{
    std::lock_guard<std::mutex> scoped_lock(*mutexDebugLog);
    if (fileout) {
        fclose(fileout);
    }
    fileout = fopen(path.c_str(), "a");
    if (!fileout) {
        return false;
    }
    setbuf(fileout, nullptr); // unbuffered
    return true;
}

void CloseDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(*mutexDebugLog);
    if (fileout) {
        fclose(fileout);
        fileout = nullptr;
    }
}

int LogPrintStr(const std::string& str)
{
    int ret = 0; // Returns total number of characters written
    std::string strTimestamped = LogTimestampStr(str, &fStartedNewLine);

    std::lock_guard<std::mutex> scoped_lock(*mutexDebugLog);
    if (fPrintToConsole) {
        // stdout carries tool output, so the log goes to stderr
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stderr);
        fflush(stderr);
    }
    if (fileout) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
    }
    return ret;
}

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        if (!bool_val) {
            // Double negatives like -nofoo=0 are supported (but discouraged)
            LogPrintf("Warning: parsed potentially confusing double-negative %s=%s\n", key, val);
        }
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Unexpected argument '%s', options must start with '-'", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        InterpretNegatedOption(key, val);

        mapArgs[key] = val;
        mapMultiArgs[key].push_back(val);
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return atoi64(it->second);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        if (mapArgs.count(strArg)) return false;
    }
    ForceSetArg(strArg, strValue);
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

bool HelpRequested(const ArgsManager& args)
{
    return args.IsArgSet("-?") || args.IsArgSet("-h") || args.IsArgSet("-help");
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message) {
    std::string out = std::string(optIndent, ' ') + std::string(option) + std::string("\n");
    // Word wrap the description at screenWidth, indented by msgIndent
    std::string line = std::string(msgIndent, ' ');
    size_t pos = 0;
    while (pos < message.size()) {
        size_t next = message.find(' ', pos);
        if (next == std::string::npos) next = message.size();
        std::string word = message.substr(pos, next - pos);
        if (line.size() > (size_t)msgIndent && line.size() + word.size() + 1 > (size_t)screenWidth) {
            out += line + "\n";
            line = std::string(msgIndent, ' ');
        }
        if (line.size() > (size_t)msgIndent) line += ' ';
        line += word;
        pos = next + 1;
    }
    out += line + "\n\n";
    return out;
}
