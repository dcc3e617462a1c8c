#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "ocs/link/parser.hh"
#include "ocs/link/tests/link-parts.hh"
#include "ocs/link/tests/parsed-link.hh"

#include <unordered_set>

namespace ocs {

static ParsedLink makeLink(std::optional<std::string> filename)
{
    return ParsedLink{
        .scheme = OcsScheme::Insecure,
        .command = OcsCommand::Download,
        .downloadUrl = parseURL("https://example.org/themes/Breeze-Dark.tar.gz"),
        .installType = "plasma_desktopthemes",
        .filename = std::move(filename),
    };
}

/* ----------------------------------------------------------------------------
 * OcsScheme / OcsCommand
 * --------------------------------------------------------------------------*/

TEST(OcsScheme, parse)
{
    ASSERT_EQ(parseOcsScheme("ocs"), OcsScheme::Insecure);
    ASSERT_EQ(parseOcsScheme("OcSs"), OcsScheme::Secure);
    ASSERT_EQ(parseOcsScheme("https"), std::nullopt);
    ASSERT_EQ(parseOcsScheme(""), std::nullopt);
}

TEST(OcsScheme, show)
{
    ASSERT_EQ(showOcsScheme(OcsScheme::Insecure), "ocs");
    ASSERT_EQ(showOcsScheme(OcsScheme::Secure), "ocss");
}

TEST(OcsCommand, parse)
{
    ASSERT_EQ(parseOcsCommand("download"), OcsCommand::Download);
    ASSERT_EQ(parseOcsCommand("INSTALL"), OcsCommand::Install);
    ASSERT_EQ(parseOcsCommand("installs"), std::nullopt);
}

TEST(OcsCommand, show)
{
    ASSERT_EQ(showOcsCommand(OcsCommand::Download), "download");
    ASSERT_EQ(showOcsCommand(OcsCommand::Install), "install");
}

/* ----------------------------------------------------------------------------
 * ParsedLink::to_string
 * --------------------------------------------------------------------------*/

TEST(ParsedLink, toStringWithoutFilename)
{
    ASSERT_EQ(
        makeLink(std::nullopt).to_string(),
        "ocs://download?url=https%3A%2F%2Fexample.org%2Fthemes%2FBreeze-Dark.tar.gz&type=plasma_desktopthemes");
}

TEST(ParsedLink, toStringWithFilename)
{
    ASSERT_EQ(
        makeLink("dark.tar.gz").to_string(),
        "ocs://download?url=https%3A%2F%2Fexample.org%2Fthemes%2FBreeze-Dark.tar.gz&type=plasma_desktopthemes"
        "&filename=dark.tar.gz");
}

TEST(ParsedLink, toStringKeepsEmptyFilename)
{
    auto s = makeLink("").to_string();

    ASSERT_TRUE(s.ends_with("&filename="));
    ASSERT_EQ(parseLink(s).filename, "");
}

TEST(ParsedLink, streamsCanonicalForm)
{
    auto link = makeLink(std::nullopt);
    std::ostringstream str;
    str << link;

    ASSERT_EQ(str.str(), link.to_string());
}

/* ----------------------------------------------------------------------------
 * ParsedLink::targetFileName
 * --------------------------------------------------------------------------*/

TEST(ParsedLink, targetFileNamePrefersFilename)
{
    ASSERT_EQ(makeLink("dark.tar.gz").targetFileName(), "dark.tar.gz");
}

TEST(ParsedLink, targetFileNameFallsBackToDownloadUrl)
{
    ASSERT_EQ(makeLink(std::nullopt).targetFileName(), "Breeze-Dark.tar.gz");
    ASSERT_EQ(makeLink("").targetFileName(), "Breeze-Dark.tar.gz");
}

TEST(ParsedLink, targetFileNameWithoutPath)
{
    auto link = makeLink(std::nullopt);
    link.downloadUrl = parseURL("https://example.org/");

    ASSERT_EQ(link.targetFileName(), std::nullopt);
}

/* ----------------------------------------------------------------------------
 * equality and hashing
 * --------------------------------------------------------------------------*/

TEST(ParsedLink, equalityIgnoresRawUri)
{
    auto a = parseLink("ocs://install?url=https%3A%2F%2Fexample.org%2Fa.ogg&type=music&extra=1");
    auto b = parseLink("OCS://INSTALL?type=music&url=https%3A%2F%2Fexample.org%2Fa.ogg");

    ASSERT_NE(a.rawUri, b.rawUri);
    ASSERT_EQ(a, b);
    ASSERT_EQ(std::hash<ParsedLink>{}(a), std::hash<ParsedLink>{}(b));
}

TEST(ParsedLink, missingAndEmptyFilenameDiffer)
{
    ASSERT_NE(makeLink(std::nullopt), makeLink(""));
}

TEST(ParsedLink, usableInUnorderedSet)
{
    std::unordered_set<ParsedLink> links;
    links.insert(makeLink(std::nullopt));
    links.insert(makeLink(std::nullopt));
    links.insert(makeLink("dark.tar.gz"));

    ASSERT_EQ(links.size(), 2);
}

#ifndef COVERAGE

RC_GTEST_PROP(ParsedLink, prop_round_trip, (const ParsedLink & link))
{
    RC_ASSERT(link == parseLink(link.to_string()));
}

RC_GTEST_PROP(ParsedLink, prop_canonical_form_is_stable, (const ParsedLink & link))
{
    auto s = link.to_string();
    RC_ASSERT(parseLink(s).to_string() == s);
}

RC_GTEST_PROP(ParsedLink, prop_equal_links_hash_equal, (const ParsedLink & link))
{
    auto reparsed = parseLink(link.to_string());
    RC_ASSERT(std::hash<ParsedLink>{}(link) == std::hash<ParsedLink>{}(reparsed));
}

#endif

} // namespace ocs
