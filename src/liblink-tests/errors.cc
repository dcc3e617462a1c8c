#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ocs/link/errors.hh"
#include "ocs/util/tests/gmock-matchers.hh"

namespace ocs {

using testing::HasSubstrIgnoreANSIMatcher;

TEST(LinkError, unrecognizedScheme)
{
    UnrecognizedScheme e("Https");

    ASSERT_EQ(e.scheme, "Https");
    EXPECT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("an unexpected OCS scheme was provided: 'Https'"));
}

TEST(LinkError, unrecognizedCommand)
{
    UnrecognizedCommand e("uninstall");

    ASSERT_EQ(e.command, "uninstall");
    EXPECT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("ask for either an 'install' or a 'download'"));
}

TEST(LinkError, uriSyntaxErrorWithCause)
{
    UriSyntaxError e(UriSyntaxError::Reason::Malformed, "leftover input");

    ASSERT_EQ(e.cause, "leftover input");
    EXPECT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("invalid URI: malformed URI: leftover input"));
}

TEST(LinkError, uriSyntaxErrorWithoutCause)
{
    UriSyntaxError e(UriSyntaxError::Reason::EmptyHost, "");

    EXPECT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("invalid URI: empty host"));
}

TEST(LinkError, reasonNames)
{
    ASSERT_EQ(showUriSyntaxErrorReason(UriSyntaxError::Reason::RelativeWithoutBase), "relative URL without a base");

    std::ostringstream str;
    str << UriSyntaxError::Reason::Malformed;
    ASSERT_EQ(str.str(), "malformed URI");
}

TEST(LinkError, hierarchy)
{
    ASSERT_THROW(throw MissingScheme("no scheme"), LinkError);
    ASSERT_THROW(throw UnknownInstallType("x"), Error);
    ASSERT_THROW(throw DecodeError("bad escape"), LinkError);
}

} // namespace ocs
