#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ocs/main/shared.hh"
#include "ocs/util/logging.hh"
#include "ocs/util/strings.hh"
#include "ocs/util/tests/gmock-matchers.hh"

namespace ocs {

static Strings parse(const Strings & args)
{
    Strings positional;
    parseCmdLine("ocs-custodian", args, [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--known")
            return true;
        if (hasPrefix(*arg, "-"))
            return false;
        positional.push_back(*arg);
        return true;
    });
    return positional;
}

TEST(parseCmdLine, positionalArguments)
{
    ASSERT_EQ(parse({"a", "--known", "b"}), (Strings{"a", "b"}));
}

TEST(parseCmdLine, dashDashEndsFlags)
{
    ASSERT_EQ(parse({"--", "--known"}), (Strings{}));
    ASSERT_THROW(parse({"--", "--verbose"}), UsageError);
}

TEST(parseCmdLine, unknownFlag)
{
    EXPECT_THAT(
        []() { parse({"--frobnicate"}); },
        ::testing::ThrowsMessage<UsageError>(testing::HasSubstrIgnoreANSIMatcher("unrecognised flag '--frobnicate'")));
}

TEST(parseCmdLine, verbosityFlags)
{
    auto saved = verbosity;

    verbosity = lvlInfo;
    parse({"-v", "--verbose"});
    ASSERT_EQ(verbosity, lvlChatty);

    parse({"--quiet"});
    ASSERT_EQ(verbosity, lvlTalkative);

    parse({"--debug"});
    ASSERT_EQ(verbosity, lvlDebug);

    verbosity = saved;
}

TEST(parseCmdLine, showTrace)
{
    showTrace = false;
    parse({"--show-trace"});
    ASSERT_TRUE(showTrace);
    showTrace = false;
}

TEST(getArg, missingArgument)
{
    Strings args{"--flag"};
    auto i = args.begin();

    EXPECT_THAT(
        [&]() { getArg("--flag", i, args.end()); },
        ::testing::ThrowsMessage<UsageError>(testing::HasSubstrIgnoreANSIMatcher("'--flag' requires an argument")));
}

TEST(getArg, advances)
{
    Strings args{"--flag", "value"};
    auto i = args.begin();

    ASSERT_EQ(getArg("--flag", i, args.end()), "value");
    ASSERT_EQ(*i, "value");
}

TEST(handleExceptions, exitStatus)
{
    ASSERT_EQ(handleExceptions("ocs-custodian", []() {}), 0);
    ASSERT_EQ(handleExceptions("ocs-custodian", []() { throw Exit(3); }), 3);
}

TEST(handleExceptions, usageErrorSuggestsHelp)
{
    ::testing::internal::CaptureStderr();
    auto status = handleExceptions("ocs-custodian", []() { throw UsageError("no links given"); });
    auto err = ::testing::internal::GetCapturedStderr();

    ASSERT_EQ(status, 1);
    EXPECT_THAT(err, testing::HasSubstrIgnoreANSIMatcher("error: no links given"));
    EXPECT_THAT(err, testing::HasSubstrIgnoreANSIMatcher("Try 'ocs-custodian --help' for more information."));
}

TEST(handleExceptions, errorStatus)
{
    ::testing::internal::CaptureStderr();
    auto status = handleExceptions("ocs-custodian", []() { throw Error(4, "bad link"); });
    ::testing::internal::GetCapturedStderr();

    ASSERT_EQ(status, 4);
}

TEST(handleExceptions, standardException)
{
    ::testing::internal::CaptureStderr();
    auto status = handleExceptions("ocs-custodian", []() { throw std::runtime_error("boom"); });
    auto err = ::testing::internal::GetCapturedStderr();

    ASSERT_EQ(status, 1);
    EXPECT_THAT(err, testing::HasSubstrIgnoreANSIMatcher("error: boom"));
}

} // namespace ocs
