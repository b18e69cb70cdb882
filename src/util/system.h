// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing.
 */
#ifndef ESCROWSWAP_UTIL_SYSTEM_H
#define ESCROWSWAP_UTIL_SYSTEM_H

#include <istream>
#include <map>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

bool InterpretBool(const std::string& strValue);

class ArgsManager
{
protected:
    mutable std::mutex cs_args;
    std::map<std::string, std::vector<std::string>> m_settings;

    static bool InterpretNegatedOption(std::string& key, std::string& val);

public:
    /**
     * Parse "-name[=value]" arguments. A leading "--" is accepted and
     * "-noname" is stored as "-name=0".
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Read "name=value" lines (no leading dash). Blank lines and lines
     * starting with '#' are ignored.
     */
    bool ReadConfigStream(std::istream& stream, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    // Forces an arg setting. Called by tests.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    // Remove all settings. Called by tests.
    void ClearArgs();
};

extern ArgsManager gArgs;

#endif // ESCROWSWAP_UTIL_SYSTEM_H
