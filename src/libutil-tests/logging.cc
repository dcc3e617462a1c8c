#include "ocs/util/logging.hh"
#include "ocs/util/terminal.hh"
#include "ocs/util/tests/gmock-matchers.hh"

#include <sstream>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace ocs {

static std::string showPlain(const ErrorInfo & info, bool showTrace = false)
{
    std::ostringstream oss;
    showErrorInfo(oss, info, showTrace);
    return filterANSIEscapes(oss.str(), true);
}

/* ----------------------------------------------------------------------------
 * showErrorInfo
 * --------------------------------------------------------------------------*/

TEST(showErrorInfo, basicProperties)
{
    MakeError(TestError, Error);

    try {
        throw TestError("an error for testing purposes");
    } catch (Error & e) {
        ASSERT_EQ(showPlain(e.info()), "error: an error for testing purposes");
        ASSERT_EQ(e.message(), "an error for testing purposes");
    }
}

TEST(showErrorInfo, argumentsAreInterpolated)
{
    Error e("unknown install type '%s'", "musik");
    ASSERT_EQ(showPlain(e.info()), "error: unknown install type 'musik'");
}

TEST(showErrorInfo, warningLevel)
{
    ErrorInfo info{.level = lvlWarn, .msg = HintFmt("something looks off")};
    ASSERT_EQ(showPlain(info), "warning: something looks off");
}

TEST(showErrorInfo, tracesComeFirst)
{
    Error e("invalid URI");
    e.addTrace("while parsing the download URL '%s'", "abc");
    e.addTrace("while parsing the link '%s'", "ocs://install");

    auto s = showPlain(e.info());
    EXPECT_THAT(s, ::testing::HasSubstr("… while parsing the link 'ocs://install'"));
    EXPECT_THAT(s, ::testing::HasSubstr("… while parsing the download URL 'abc'"));
    EXPECT_LT(s.find("while parsing the link"), s.find("while parsing the download URL"));
    EXPECT_LT(s.find("while parsing the download URL"), s.find("error: invalid URI"));
}

TEST(showErrorInfo, longTracesAreTruncated)
{
    Error e("too deep");
    for (int i = 0; i < 6; ++i)
        e.addTrace("trace %d", i);

    EXPECT_THAT(showPlain(e.info(), false), ::testing::HasSubstr("stack trace truncated"));
    EXPECT_THAT(showPlain(e.info(), true), ::testing::Not(::testing::HasSubstr("stack trace truncated")));
    EXPECT_THAT(showPlain(e.info(), true), ::testing::HasSubstr("trace 0"));
}

TEST(showErrorInfo, suggestions)
{
    Error e(Suggestions::bestMatches({"icons", "books"}, "icon"), "unknown install type '%s'", "icon");

    EXPECT_THAT(showPlain(e.info()), ::testing::HasSubstr("Did you mean icons?"));
}

TEST(showErrorInfo, noSuggestionsWhenNothingIsClose)
{
    Error e(Suggestions::bestMatches({"icons", "books"}, "bigger farts"), "unknown install type");

    EXPECT_THAT(showPlain(e.info()), ::testing::Not(::testing::HasSubstr("Did you mean")));
}

TEST(BaseError, whatIsCached)
{
    UsageError e("unexpected argument '%s'", "foo");
    std::string what = e.what();

    EXPECT_THAT(what, testing::HasSubstrIgnoreANSIMatcher("error: unexpected argument 'foo'"));
    ASSERT_EQ(e.what(), e.what());
}

/* ----------------------------------------------------------------------------
 * logger
 * --------------------------------------------------------------------------*/

TEST(logEI, writesToStderr)
{
    Error e("an error for testing purposes");

    ::testing::internal::CaptureStderr();
    logger->logEI(e.info());
    auto str = ::testing::internal::GetCapturedStderr();

    /* No syslog-style `<N>` level prefix, whatever the environment. */
    EXPECT_EQ(filterANSIEscapes(str, true), "error: an error for testing purposes\n");
}

TEST(logEI, belowVerbosityIsSuppressed)
{
    auto saved = verbosity;
    verbosity = lvlError;

    ::testing::internal::CaptureStderr();
    logWarning(Error("quiet please").info());
    auto str = ::testing::internal::GetCapturedStderr();

    verbosity = saved;
    ASSERT_EQ(str, "");
}

TEST(logger, warnHasPrefix)
{
    ::testing::internal::CaptureStderr();
    warn("dubious URI query '%s'", "flag");
    auto str = ::testing::internal::GetCapturedStderr();

    EXPECT_THAT(str, testing::HasSubstrIgnoreANSIMatcher("warning: dubious URI query 'flag'"));
}

TEST(logEI, showTraceLiftsTheTraceLimit)
{
    Error e("too deep");
    for (int i = 0; i < 6; ++i)
        e.addTrace("trace %d", i);

    ::testing::internal::CaptureStderr();
    logger->logEI(e.info());
    auto truncated = ::testing::internal::GetCapturedStderr();

    showTrace = true;
    ::testing::internal::CaptureStderr();
    logger->logEI(e.info());
    auto full = ::testing::internal::GetCapturedStderr();
    showTrace = false;

    EXPECT_THAT(truncated, testing::HasSubstrIgnoreANSIMatcher("stack trace truncated"));
    EXPECT_THAT(full, testing::HasSubstrIgnoreANSIMatcher("trace 0"));
    EXPECT_THAT(full, ::testing::Not(testing::HasSubstrIgnoreANSIMatcher("stack trace truncated")));
}

TEST(logger, debugDependsOnVerbosity)
{
    auto saved = verbosity;

    verbosity = lvlInfo;
    ::testing::internal::CaptureStderr();
    debug("resolving install type '%s'", "icons");
    ASSERT_EQ(::testing::internal::GetCapturedStderr(), "");

    verbosity = lvlDebug;
    ::testing::internal::CaptureStderr();
    debug("resolving install type '%s'", "icons");
    auto str = ::testing::internal::GetCapturedStderr();

    verbosity = saved;
    EXPECT_THAT(str, testing::HasSubstrIgnoreANSIMatcher("resolving install type 'icons'"));
}

TEST(logger, coutWritesToStdout)
{
    ::testing::internal::CaptureStdout();
    logger->cout("install path: %s", "$HOME/Music");
    auto str = ::testing::internal::GetCapturedStdout();

    ASSERT_EQ(str, "install path: $HOME/Music\n");
}

} // namespace ocs
