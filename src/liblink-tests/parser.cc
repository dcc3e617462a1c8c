#include "ocs/link/parser.hh"
#include "ocs/link/tests/link-parts.hh"
#include "ocs/util/logging.hh"
#include "ocs/util/tests/gmock-matchers.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <rapidcheck/gtest.h>

namespace ocs {

using testing::LinkParts;
using testing::newLink;
using ::testing::Field;
using ::testing::Throws;

using Reason = UriSyntaxError::Reason;

static auto uriSyntaxError(Reason reason)
{
    return Throws<UriSyntaxError>(Field(&UriSyntaxError::reason, reason));
}

/* ----------------------------------------------------------------------------
 * well-formed links
 * --------------------------------------------------------------------------*/

TEST(parseLink, defaultLink)
{
    auto link = parseLink(testing::defaultLink());

    EXPECT_EQ(link.scheme, OcsScheme::Insecure);
    EXPECT_EQ(link.command, OcsCommand::Install);
    EXPECT_EQ(link.downloadUrl, parseURL("https://fake.download/location.png"));
    EXPECT_EQ(link.installType, "plasma_look_and_feel");
    EXPECT_EQ(link.filename, "location55.png");
}

TEST(parseLink, canonicalFormRendersBackIdentically)
{
    auto s = testing::defaultLink();
    ASSERT_EQ(parseLink(s).to_string(), s);
}

TEST(parseLink, secureSchemeAndDownloadCommand)
{
    auto link = parseLink("ocss://download?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music");

    EXPECT_EQ(link.scheme, OcsScheme::Secure);
    EXPECT_EQ(link.command, OcsCommand::Download);
    EXPECT_EQ(link.installType, "music");
    EXPECT_EQ(link.filename, std::nullopt);
    EXPECT_EQ(link.targetFileName(), "a.ogg");
}

TEST(parseLink, schemeAndCommandAreCaseInsensitive)
{
    auto link = parseLink("OCS://Install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music");

    EXPECT_EQ(link.scheme, OcsScheme::Insecure);
    EXPECT_EQ(link.command, OcsCommand::Install);
    EXPECT_EQ(link.to_string(), "ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music");
}

TEST(parseLink, parameterOrderDoesNotMatter)
{
    auto a = parseLink("ocs://install?type=music&filename=a.ogg&url=https%3A%2F%2Fexample.org%2Fa.ogg");
    auto b = parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music&filename=a.ogg");

    ASSERT_EQ(a, b);
}

TEST(parseLink, lastDuplicateParameterWins)
{
    auto link = parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music&type=books");

    ASSERT_EQ(link.installType, "books");
}

TEST(parseLink, unknownParametersAreKeptInRawUri)
{
    auto link = parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music&extra=1");

    ASSERT_EQ(link.rawUri.query.at("extra"), "1");
    ASSERT_EQ(link.to_string().find("extra"), std::string::npos);
}

TEST(parseLink, installTypeIsNotValidated)
{
    auto link = parseLink(newLink(LinkParts::InstallType, "bigger_farts"));

    ASSERT_EQ(link.installType, "bigger_farts");
}

TEST(parseLink, unencodedDownloadUrl)
{
    auto link = parseLink("ocs://install?url=https://example.org/a.ogg&type=music");

    ASSERT_EQ(link.downloadUrl, parseURL("https://example.org/a.ogg"));
    ASSERT_EQ(link.to_string(), "ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music");
}

TEST(parseLink, filenameWithEncodedSpace)
{
    auto link = parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.tar.gz&type=themes&filename=My%20Theme.tar.gz");

    EXPECT_EQ(link.filename, "My Theme.tar.gz");
    EXPECT_EQ(link.targetFileName(), "My Theme.tar.gz");
    EXPECT_EQ(parseLink(link.to_string()), link);
}

TEST(parseLink, filenameWithNonAsciiText)
{
    auto link = parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.png&type=wallpapers&filename=%C3%A9t%C3%A9.png");

    EXPECT_EQ(link.filename, "été.png");
    EXPECT_EQ(parseLink(link.to_string()), link);
}

TEST(parseLink, downloadUrlWithDoublyEncodedSpace)
{
    auto link = parseLink("ocs://download?url=https%3A%2F%2Fexample.org%2FMy%2520Theme.png&type=wallpapers");

    EXPECT_EQ(link.downloadUrl.path, (std::vector<std::string>{"", "My Theme.png"}));
    EXPECT_EQ(link.targetFileName(), "My Theme.png");
    EXPECT_EQ(link.downloadUrl.to_string(), "https://example.org/My%20Theme.png");
    EXPECT_EQ(link.to_string(), "ocs://download?url=https%3A%2F%2Fexample.org%2FMy%2520Theme.png&type=wallpapers");
}

TEST(parseLink, downloadUrlWithRawNonAsciiPath)
{
    auto link = parseLink("ocs://download?url=https://example.org/%E5%86%86.png&type=wallpapers");

    EXPECT_EQ(link.targetFileName(), "円.png");
    EXPECT_EQ(parseLink(link.to_string()), link);
}

TEST(parseLink, parsingLogsNothing)
{
    auto saved = verbosity;
    verbosity = lvlVomit;

    ::testing::internal::CaptureStderr();
    parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music&flag&filename=a.ogg");
    auto err = ::testing::internal::GetCapturedStderr();

    verbosity = saved;
    ASSERT_EQ(err, "");
}

/* ----------------------------------------------------------------------------
 * malformed links
 * --------------------------------------------------------------------------*/

TEST(parseLink, emptyLink)
{
    EXPECT_THAT([]() { parseLink(""); }, uriSyntaxError(Reason::RelativeWithoutBase));
}

TEST(parseLink, noScheme)
{
    EXPECT_THAT(
        []() { parseLink("download?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music"); },
        uriSyntaxError(Reason::RelativeWithoutBase));
}

TEST(parseLink, garbage)
{
    EXPECT_THAT(
        []() { parseLink("sduigh:sdiguhcc8////s::;dij"); },
        Throws<UnrecognizedScheme>(Field(&UnrecognizedScheme::scheme, "sduigh")));
}

TEST(parseLink, queryWithoutAmpersands)
{
    EXPECT_THAT(
        []() { parseLink("abc://download?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music?filename=a.ogg"); },
        Throws<UnrecognizedScheme>(Field(&UnrecognizedScheme::scheme, "abc")));
}

TEST(parseLink, queryKeysAreCaseSensitive)
{
    EXPECT_THROW(parseLink("OCS://INSTALL?URL=https%3A%2F%2Fexample.org%2Fa.ogg&TYPE=music"), MissingDownloadUrl);
}

TEST(parseLink, missingCommand)
{
    EXPECT_THROW(parseLink("ocs:install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music"), MissingCommand);
}

TEST(parseLink, missingDownloadUrl)
{
    EXPECT_THAT(
        []() { parseLink("ocs://install?type=music"); },
        ocs::testing::ThrowsMessageIgnoreANSI<MissingDownloadUrl>("no download URL"));
}

TEST(parseLink, missingInstallType)
{
    EXPECT_THROW(parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg"), MissingInstallType);
}

TEST(parseLink, badPercentEncoding)
{
    EXPECT_THROW(parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music%2"), DecodeError);
}

TEST(parseLink, invalidUtf8)
{
    EXPECT_THAT(
        []() { parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=%FF"); },
        ocs::testing::ThrowsMessageIgnoreANSI<DecodeError>("valid UTF-8"));
}

TEST(parseLink, invalidUtf8AfterSecondDecoding)
{
    EXPECT_THAT(
        []() { parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=%25FF"); },
        ocs::testing::ThrowsMessageIgnoreANSI<DecodeError>("the value of the 'type' parameter"));
}

TEST(parseLink, controlCharacterInDownloadUrl)
{
    EXPECT_THAT(
        []() { parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa%250A.ogg&type=music"); },
        uriSyntaxError(Reason::Malformed));
}

TEST(parseLink, errorsAreLinkErrors)
{
    EXPECT_THROW(parseLink("http://example.org"), LinkError);
    EXPECT_THROW(parseLink(""), LinkError);
    EXPECT_THROW(parseLink("ocs://install"), LinkError);
}

TEST(parseLink, badDownloadUrlHasTrace)
{
    try {
        parseLink(newLink(LinkParts::DownloadUrl, "abc"));
        FAIL() << "expected an exception";
    } catch (UriSyntaxError & e) {
        ASSERT_EQ(e.reason, Reason::RelativeWithoutBase);
        ASSERT_EQ(e.info().traces.size(), 1);
        EXPECT_THAT(
            e.info().traces.front().hint.str(),
            ocs::testing::HasSubstrIgnoreANSIMatcher("while parsing the download URL 'abc'"));
    }
}

/* ----------------------------------------------------------------------------
 * one part replaced by something unexpected
 * --------------------------------------------------------------------------*/

static const std::string weird = "abc";
static const std::string blank = "";
static const std::string crazy = "#(*H(F*(DH*HS(*D))));";

static std::string longString()
{
    std::string s;
    for (int i = 0; i < 400; ++i)
        s += "abcd";
    return s;
}

TEST(parseLink, weirdScheme)
{
    EXPECT_THAT(
        []() { parseLink(newLink(LinkParts::Scheme, weird)); },
        Throws<UnrecognizedScheme>(Field(&UnrecognizedScheme::scheme, weird)));
}

TEST(parseLink, weirdCommand)
{
    EXPECT_THAT(
        []() { parseLink(newLink(LinkParts::Command, weird)); },
        Throws<UnrecognizedCommand>(Field(&UnrecognizedCommand::command, weird)));
}

TEST(parseLink, weirdDownloadUrl)
{
    EXPECT_THAT([]() { parseLink(newLink(LinkParts::DownloadUrl, weird)); }, uriSyntaxError(Reason::RelativeWithoutBase));
}

TEST(parseLink, weirdFilename)
{
    ASSERT_EQ(parseLink(newLink(LinkParts::Filename, weird)).filename, weird);
}

TEST(parseLink, blankScheme)
{
    EXPECT_THROW(parseLink(newLink(LinkParts::Scheme, blank)), UriSyntaxError);
}

TEST(parseLink, blankCommand)
{
    EXPECT_THAT([]() { parseLink(newLink(LinkParts::Command, blank)); }, uriSyntaxError(Reason::EmptyHost));
}

TEST(parseLink, blankDownloadUrl)
{
    EXPECT_THAT([]() { parseLink(newLink(LinkParts::DownloadUrl, blank)); }, uriSyntaxError(Reason::RelativeWithoutBase));
}

TEST(parseLink, blankFilename)
{
    auto link = parseLink(newLink(LinkParts::Filename, blank));

    EXPECT_EQ(link.filename, "");
    EXPECT_EQ(link.targetFileName(), "location.png");
}

TEST(parseLink, longScheme)
{
    EXPECT_THAT(
        []() { parseLink(newLink(LinkParts::Scheme, longString())); },
        Throws<UnrecognizedScheme>(Field(&UnrecognizedScheme::scheme, longString())));
}

TEST(parseLink, longCommand)
{
    EXPECT_THAT(
        []() { parseLink(newLink(LinkParts::Command, longString())); },
        Throws<UnrecognizedCommand>(Field(&UnrecognizedCommand::command, longString())));
}

TEST(parseLink, longDownloadUrl)
{
    auto link = parseLink(newLink(LinkParts::DownloadUrl, "https://" + longString() + ")"));

    EXPECT_EQ(link.downloadUrl.authority->host, longString() + ")");
}

TEST(parseLink, longFilename)
{
    ASSERT_EQ(parseLink(newLink(LinkParts::Filename, longString())).filename, longString());
}

TEST(parseLink, crazyScheme)
{
    EXPECT_THAT([]() { parseLink(newLink(LinkParts::Scheme, crazy)); }, uriSyntaxError(Reason::RelativeWithoutBase));
}

TEST(parseLink, crazyCommand)
{
    EXPECT_THAT([]() { parseLink(newLink(LinkParts::Command, crazy)); }, uriSyntaxError(Reason::EmptyHost));
}

TEST(parseLink, crazyDownloadUrl)
{
    EXPECT_THAT([]() { parseLink(newLink(LinkParts::DownloadUrl, crazy)); }, uriSyntaxError(Reason::RelativeWithoutBase));
}

TEST(parseLink, crazyFilename)
{
    auto link = parseLink(newLink(LinkParts::Filename, crazy));

    EXPECT_EQ(link.filename, "");
    EXPECT_EQ(link.rawUri.fragment, crazy.substr(1));
}

/* ----------------------------------------------------------------------------
 * checkInstallType
 * --------------------------------------------------------------------------*/

TEST(checkInstallType, knownType)
{
    auto link = parseLink(testing::defaultLink());

    ASSERT_EQ(checkInstallType(link), InstallType{QtGeneral::PlasmaLookAndFeel});
}

TEST(checkInstallType, unknownTypeHasSuggestions)
{
    auto link = parseLink(newLink(LinkParts::InstallType, "musik"));

    try {
        checkInstallType(link);
        FAIL() << "expected an exception";
    } catch (UnknownInstallType & e) {
        ASSERT_EQ(e.installType, "musik");
        EXPECT_THAT(e.what(), ocs::testing::HasSubstrIgnoreANSIMatcher("an unknown install type was given: 'musik'"));
        EXPECT_THAT(e.what(), ocs::testing::HasSubstrIgnoreANSIMatcher("Did you mean music?"));
    }
}

#ifndef COVERAGE

RC_GTEST_PROP(parseLink, prop_arbitrary_input_fails_with_link_error, (const std::string & s))
{
    try {
        parseLink(s);
    } catch (LinkError &) {
        RC_SUCCEED("rejected");
    }
}

#endif

} // namespace ocs
