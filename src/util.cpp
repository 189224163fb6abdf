// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <utilstrencodings.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <stdio.h>
#include <typeinfo>

ArgsManager gArgs;
bool fPrintToConsole = false;
bool fPrintToDebugLog = false;
bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

namespace {

std::mutex cs_log;
FILE* fileout = nullptr;

/**
 * fStartedNewLine is a state variable held by the calling context that will
 * suppress printing of the timestamp when multiple calls are made that don't
 * end in a newline.
 */
bool fStartedNewLine = true;

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::DA, "da"},
    {BCLog::SCAN, "scan"},
    {BCLog::CHAIN, "chain"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

std::string LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (fStartedNewLine) {
        char buf[32];
        time_t now = time(nullptr);
        struct tm tm_utc;
        gmtime_r(&now, &tm_utc);
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        strStamped = std::string(buf) + ' ' + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size()-1] == '\n')
        fStartedNewLine = true;
    else
        fStartedNewLine = false;

    return strStamped;
}

/** Interpret string as boolean, for argument parsing */
bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length()>3 && strKey[0]=='-' && strKey[1]=='n' && strKey[2]=='o')
    {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

} // anonymous namespace

bool GetLogCategory(uint32_t *f, const std::string *str)
{
    if (f && str) {
        if (*str == "") {
            *f = BCLog::ALL;
            return true;
        }
        for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
            if (LogCategories[i].category == *str) {
                *f = LogCategories[i].flag;
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
    for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
        // Omit the special cases.
        if (LogCategories[i].flag != BCLog::NONE && LogCategories[i].flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += LogCategories[i].category;
            outcount++;
        }
    }
    return ret;
}

bool OpenDebugLog(const std::string& path)
{
    std::lock_guard<std::mutex> lock(cs_log);
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
    std::lock_guard<std::mutex> lock(cs_log);
    if (fileout) {
        fclose(fileout);
        fileout = nullptr;
    }
}

int LogPrintStr(const std::string &str)
{
    int ret = 0; // Returns total number of characters written
    std::lock_guard<std::mutex> lock(cs_log);

    std::string strTimestamped = LogTimestampStr(str);

    if (fPrintToConsole) {
        // print to console; stdout is reserved for command output
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stderr);
        fflush(stderr);
    }
    if (fPrintToDebugLog && fileout) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
    }
    return ret;
}

void ArgsManager::ParseParameters(int argc, const char* const argv[])
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++)
    {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos)
        {
            strValue = str.substr(is_index+1);
            str = str.substr(0, is_index);
        }

        if (str[0] != '-')
            break;

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
}

void ArgsManager::ReadConfigFile(const std::string& confPath)
{
    std::ifstream streamConfig(confPath);
    if (!streamConfig.good()) {
        throw std::runtime_error(strprintf("Unable to open config file %s", confPath));
    }

    std::lock_guard<std::mutex> lock(cs_args);
    std::string line;
    int nLine = 0;
    while (std::getline(streamConfig, line)) {
        nLine++;
        std::string::size_type comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = TrimString(line);
        if (line.empty()) {
            continue;
        }
        std::string::size_type eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error(strprintf("Malformed line %d in config file %s: %s", nLine, confPath, line));
        }
        std::string strKey = "-" + TrimString(line.substr(0, eq));
        std::string strValue = TrimString(line.substr(eq + 1));
        InterpretNegativeSetting(strKey, strValue);
        // Don't overwrite existing settings so command line settings override the config file
        if (mapArgs.count(strKey) == 0) {
            mapArgs[strKey] = strValue;
        }
        mapMultiArgs[strKey].push_back(strValue);
    }
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
    std::lock_guard<std::mutex> lock(cs_args);
    if (mapArgs.count(strArg))
        return false;
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
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

bool InitLogging(bool fConsoleDefault)
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", fConsoleDefault);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    uint32_t flags = 0;
    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        if (std::find(categories.begin(), categories.end(), std::string("0")) == categories.end()) {
            for (const auto& cat : categories) {
                uint32_t flag = 0;
                if (!GetLogCategory(&flag, &cat)) {
                    LogPrintf("Unsupported logging category -debug=%s. Valid categories: %s\n", cat, ListLogCategories());
                    return false;
                }
                flags |= flag;
            }
        }
    }
    logCategories = flags;

    if (gArgs.IsArgSet("-debuglogfile")) {
        const std::string path = gArgs.GetArg("-debuglogfile", "");
        if (!OpenDebugLog(path)) {
            LogPrintf("Could not open debug log file %s\n", path);
            return false;
        }
        fPrintToDebugLog = true;
    }
    return true;
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    std::string ret = std::string(optIndent,' ') + std::string(option) + std::string("\n");
    std::string::size_type pos = 0;
    while (pos < message.size()) {
        std::string::size_type len = std::min<std::string::size_type>(message.size() - pos, screenWidth - msgIndent);
        ret += std::string(msgIndent,' ') + message.substr(pos, len) + std::string("\n");
        pos += len;
    }
    return ret + std::string("\n");
}

std::string FormatException(const std::exception* pex, const char* pszThread)
{
    if (pex)
        return strprintf(
            "EXCEPTION: %s       \n%s       \n%s in %s       \n", typeid(*pex).name(), pex->what(), "dacheck", pszThread);
    else
        return strprintf(
            "UNKNOWN EXCEPTION       \n%s in %s       \n", "dacheck", pszThread);
}

void PrintExceptionContinue(const std::exception* pex, const char* pszThread)
{
    std::string message = FormatException(pex, pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}
