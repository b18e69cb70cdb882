// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "utilstrencodings.h"

#include <stdlib.h>

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue.c_str()) != 0);
}

/**
 * Interpret -nofoo as if the user supplied -foo=0.
 *
 * This method also tracks when the -no form was supplied, and treats "-foo" as
 * a negated option when this happens. This can be later used to detect a
 * double-negated option like "-nofoo=0".
 */
bool ArgsManager::InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
        return true;
    }
    return false;
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_settings.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = "Invalid parameter " + std::string(argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);

        InterpretNegatedOption(key, val);
        m_settings[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);

    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos = str.find('#');
        if (pos != std::string::npos) {
            str = str.substr(0, pos);
        }
        const static std::string pattern = " \t\r\n";
        size_t first = str.find_first_not_of(pattern);
        if (first == std::string::npos) {
            ++linenr;
            continue;
        }
        str = str.substr(first, str.find_last_not_of(pattern) - first + 1);

        pos = str.find('=');
        if (pos == std::string::npos || pos == 0) {
            error = "parse error on line " + std::to_string(linenr) + ": " + str;
            return false;
        }
        std::string name = "-" + str.substr(0, str.find_last_not_of(pattern, pos - 1) + 1);
        std::string value = str.substr(pos + 1);
        size_t vfirst = value.find_first_not_of(pattern);
        value = vfirst == std::string::npos ? "" : value.substr(vfirst);

        InterpretNegatedOption(name, value);
        // Command line settings take precedence over the config file
        if (!m_settings.count(name)) {
            m_settings[name].push_back(value);
        }
        ++linenr;
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = m_settings.find(strArg);
    if (it == m_settings.end()) return {};
    return it->second;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    return m_settings.count(strArg) != 0;
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = m_settings.find(strArg);
    if (it == m_settings.end() || it->second.empty()) return strDefault;
    // Last value wins
    return it->second.back();
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::string value = GetArg(strArg, std::string());
    if (value.empty() && !IsArgSet(strArg)) return nDefault;

    int64_t n = 0;
    if (!ParseInt64(value, &n)) return 0;
    return n;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    if (!IsArgSet(strArg)) return fDefault;
    return InterpretBool(GetArg(strArg, std::string()));
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    if (m_settings.count(strArg)) return false;
    m_settings[strArg] = {strValue};
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_settings[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_settings.clear();
}
