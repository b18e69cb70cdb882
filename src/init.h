// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ESCROWSWAP_INIT_H
#define ESCROWSWAP_INIT_H

#include <string>

class ArgsManager;

/**
 * InitLogging - Apply -printtoconsole, -logtimestamps, -debuglogfile and
 * -debug=<category> to the global logger.
 *
 * @param args Parsed arguments (normally gArgs)
 * @param error Output: first unknown category or unwritable log file
 * @return false if an option could not be applied
 */
bool InitLogging(const ArgsManager& args, std::string& error);

/** Usage text for the options read by InitLogging() and the escrow engine */
std::string HelpMessage();

#endif // ESCROWSWAP_INIT_H
