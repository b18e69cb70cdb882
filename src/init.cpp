// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "escrow/params.h"
#include "logging.h"
#include "util/system.h"

bool InitLogging(const ArgsManager& args, std::string& error)
{
    BCLog::Logger& logger = LogInstance();

    logger.m_print_to_console = args.GetBoolArg("-printtoconsole", false);
    logger.m_log_timestamps = args.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (args.IsArgSet("-debuglogfile")) {
        logger.m_file_path = args.GetArg("-debuglogfile", "");
        if (!logger.OpenDebugLog()) {
            error = strprintf("Could not open debug log file %s", logger.m_file_path);
            return false;
        }
    }

    if (args.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = args.GetArgs("-debug");
        bool fNone = false;
        for (const std::string& cat : categories) {
            if (cat == "0" || cat == "none") {
                fNone = true;
                break;
            }
        }
        if (!fNone) {
            for (const std::string& cat : categories) {
                if (!logger.EnableCategory(cat)) {
                    error = strprintf("Unsupported logging category -debug=%s.", cat);
                    return false;
                }
            }
        }
    }

    std::string strActive;
    for (const CLogCategoryActive& cat : ListActiveLogCategories()) {
        if (!cat.active) continue;
        if (!strActive.empty()) strActive += ",";
        strActive += cat.category;
    }
    LogPrintf("Escrow engine logging: debug categories=%s max fill gas=%d Tgas\n",
              strActive.empty() ? "none" : strActive, GetMaxFillGas() / TGAS);
    return true;
}

std::string HelpMessage()
{
    std::string strUsage;
    strUsage += "Options:\n";
    strUsage += "  -debug=<category>      Output debugging information (default: 0). <category> can be 1, all, " + ListLogCategories() + "\n";
    strUsage += "  -debuglogfile=<file>   Append log output to <file>\n";
    strUsage += "  -logtimestamps         Prepend debug output with timestamp (default: 1)\n";
    strUsage += "  -printtoconsole        Send trace/debug info to console\n";
    strUsage += strprintf("  -maxfillgas=<n>        Gas ceiling in Tgas for completing one fill; can only lower the default (default: %d)\n",
                          DEFAULT_MAX_FILL_GAS / TGAS);
    return strUsage;
}
