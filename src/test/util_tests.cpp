// Copyright (c) 2025 The BATHRON developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_escrow.h"

#include "hash.h"
#include "init.h"
#include "logging.h"
#include "uint256.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <sstream>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    ArgsManager args;
    std::string error;
    const char* argv[] = {"escrowd", "-debug=fill", "--printtoconsole", "-nologtimestamps", "-debug=transfer"};
    BOOST_CHECK(args.ParseParameters(5, argv, error));

    BOOST_CHECK(args.IsArgSet("-printtoconsole"));
    BOOST_CHECK(args.GetBoolArg("-printtoconsole", false));
    BOOST_CHECK(!args.GetBoolArg("-logtimestamps", true));
    BOOST_CHECK_EQUAL(args.GetArgs("-debug").size(), 2U);
    BOOST_CHECK_EQUAL(args.GetArg("-debug", ""), "transfer");
    BOOST_CHECK(!args.IsArgSet("-maxfillgas"));
    BOOST_CHECK_EQUAL(args.GetArg("-maxfillgas", (int64_t)260), 260);

    const char* bad[] = {"escrowd", "debug"};
    BOOST_CHECK(!args.ParseParameters(2, bad, error));
}

BOOST_AUTO_TEST_CASE(util_ReadConfigStream)
{
    ArgsManager args;
    std::string error;
    const char* argv[] = {"escrowd", "-maxfillgas=120"};
    BOOST_REQUIRE(args.ParseParameters(2, argv, error));

    std::istringstream stream("# comment\n"
                              "\n"
                              "maxfillgas = 200\n"
                              "debug=escrow  # trailing\n"
                              "noprinttoconsole=1\n");
    BOOST_CHECK(args.ReadConfigStream(stream, error));
    // Command line wins over the config file
    BOOST_CHECK_EQUAL(args.GetArg("-maxfillgas", (int64_t)0), 120);
    BOOST_CHECK_EQUAL(args.GetArg("-debug", ""), "escrow");
    BOOST_CHECK(!args.GetBoolArg("-printtoconsole", true));

    std::istringstream bad("maxfillgas\n");
    BOOST_CHECK(!args.ReadConfigStream(bad, error));
    BOOST_CHECK(error.find("line 1") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(util_SoftSetArg)
{
    ArgsManager args;
    BOOST_CHECK(args.SoftSetArg("-debug", "fill"));
    BOOST_CHECK(!args.SoftSetArg("-debug", "escrow"));
    BOOST_CHECK_EQUAL(args.GetArg("-debug", ""), "fill");
    args.ForceSetArg("-debug", "escrow");
    BOOST_CHECK_EQUAL(args.GetArg("-debug", ""), "escrow");
    args.ClearArgs();
    BOOST_CHECK(!args.IsArgSet("-debug"));
}

BOOST_AUTO_TEST_CASE(logging_categories)
{
    BCLog::LogFlags flag;
    BOOST_CHECK(GetLogCategory(flag, "fill"));
    BOOST_CHECK_EQUAL(flag, BCLog::FILL);
    BOOST_CHECK(GetLogCategory(flag, "all"));
    BOOST_CHECK_EQUAL(flag, BCLog::ALL);
    BOOST_CHECK(!GetLogCategory(flag, "mempool"));
    BOOST_CHECK_EQUAL(ListLogCategories(), "escrow, fill, transfer");

    BCLog::Logger& logger = LogInstance();
    BOOST_CHECK(!logger.WillLogCategory(BCLog::ESCROW));
    BOOST_CHECK(logger.EnableCategory("transfer"));
    BOOST_CHECK(logger.WillLogCategory(BCLog::TRANSFER));
    BOOST_CHECK(!logger.WillLogCategory(BCLog::FILL));
    BOOST_CHECK(!logger.EnableCategory("bogus"));
    logger.DisableCategory(BCLog::ALL);
    BOOST_CHECK(!logger.WillLogCategory(BCLog::TRANSFER));
}

BOOST_AUTO_TEST_CASE(init_logging_applies_options)
{
    ArgsManager args;
    std::string error;
    const char* argv[] = {"escrowd", "-debug=escrow", "-debug=fill", "-nologtimestamps"};
    BOOST_REQUIRE(args.ParseParameters(4, argv, error));
    BOOST_CHECK(InitLogging(args, error));

    BCLog::Logger& logger = LogInstance();
    BOOST_CHECK(logger.WillLogCategory(BCLog::ESCROW));
    BOOST_CHECK(logger.WillLogCategory(BCLog::FILL));
    BOOST_CHECK(!logger.WillLogCategory(BCLog::TRANSFER));
    BOOST_CHECK(!logger.m_log_timestamps);
    BOOST_CHECK(!logger.m_print_to_console);

    const char* bad[] = {"escrowd", "-debug=bogus"};
    BOOST_REQUIRE(args.ParseParameters(2, bad, error));
    BOOST_CHECK(!InitLogging(args, error));
    BOOST_CHECK(error.find("bogus") != std::string::npos);

    logger.DisableCategory(BCLog::ALL);
    logger.m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

    BOOST_CHECK(HelpMessage().find("-maxfillgas") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(sha256_known_vector)
{
    CHashWriter ss;
    ss.write("abc", 3);
    BOOST_CHECK_EQUAL(ss.GetHash().GetHex(),
                      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

BOOST_AUTO_TEST_CASE(uint256_hex_round_trip)
{
    const std::string strHex = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    uint256 value = uint256S(strHex);
    BOOST_CHECK_EQUAL(value.GetHex(), strHex);
    BOOST_CHECK(uint256S("0x" + strHex) == value);
    BOOST_CHECK(uint256() < value);
    BOOST_CHECK(uint256().IsNull());

    BOOST_CHECK(IsHex("00ff"));
    BOOST_CHECK(!IsHex("0ff"));
    const std::vector<unsigned char> vch = ParseHex("deadbeef");
    BOOST_CHECK_EQUAL(vch.size(), 4U);
    BOOST_CHECK_EQUAL(HexStr(vch.begin(), vch.end()), "deadbeef");
}

BOOST_AUTO_TEST_CASE(mock_time)
{
    BOOST_CHECK_EQUAL(GetTime(), TEST_NOW);
    SetMockTime(TEST_NOW + 5);
    BOOST_CHECK_EQUAL(GetTime(), TEST_NOW + 5);
    BOOST_CHECK_EQUAL(FormatISO8601DateTime(TEST_NOW), "2023-11-14T22:13:20Z");
}

BOOST_AUTO_TEST_SUITE_END()
