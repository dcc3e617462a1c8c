#include <gtest/gtest.h>

#include "ocs/util/strings.hh"
#include "ocs/util/util.hh"

namespace ocs {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, nothingToJoin)
{
    ASSERT_EQ(concatStringsSep("/", std::vector<std::string>{}), "");
}

TEST(concatStringsSep, keepsEmptyElements)
{
    ASSERT_EQ(concatStringsSep("/", std::vector<std::string>{"", "themes", ""}), "/themes/");
}

TEST(concatStringsSep, joinsHostLabels)
{
    ASSERT_EQ(concatStringsSep(".", std::vector<std::string>{"dl", "opendesktop", "org"}), "dl.opendesktop.org");
}

TEST(concatStringsSep, setIsSorted)
{
    StringSet names = {"music", "bin", "icons"};

    ASSERT_EQ(concatStringsSep(", ", names), "bin, icons, music");
}

/* ----------------------------------------------------------------------------
 * splitString
 * --------------------------------------------------------------------------*/

using SplitStringContainers = ::testing::Types<std::vector<std::string>, std::vector<std::string_view>>;

template<typename T>
class splitStringTest : public ::testing::Test
{};

TYPED_TEST_SUITE(splitStringTest, SplitStringContainers);

TYPED_TEST(splitStringTest, emptyInputGivesOneEmptyPiece)
{
    EXPECT_EQ(splitString<TypeParam>("", "/"), TypeParam{""});
}

TYPED_TEST(splitStringTest, leadingSeparator)
{
    EXPECT_EQ(splitString<TypeParam>("/icons/a.png", "/"), (TypeParam{"", "icons", "a.png"}));
}

TYPED_TEST(splitStringTest, trailingSeparator)
{
    EXPECT_EQ(splitString<TypeParam>("/icons/", "/"), (TypeParam{"", "icons", ""}));
}

TYPED_TEST(splitStringTest, runOfSeparators)
{
    EXPECT_EQ(splitString<TypeParam>("a//b", "/"), (TypeParam{"a", "", "b"}));
}

TYPED_TEST(splitStringTest, anySeparatorCharacter)
{
    EXPECT_EQ(splitString<TypeParam>("url=x&type", "=&"), (TypeParam{"url", "x", "type"}));
}

/* ----------------------------------------------------------------------------
 * hasPrefix
 * --------------------------------------------------------------------------*/

TEST(hasPrefix, flags)
{
    ASSERT_TRUE(hasPrefix("--canonical", "-"));
    ASSERT_TRUE(hasPrefix("--canonical", "--"));
    ASSERT_FALSE(hasPrefix("ocs://install", "-"));
}

TEST(hasPrefix, emptyPrefix)
{
    ASSERT_TRUE(hasPrefix("", ""));
    ASSERT_TRUE(hasPrefix("ocs", ""));
}

TEST(hasPrefix, prefixLongerThanString)
{
    ASSERT_FALSE(hasPrefix("-", "--"));
    ASSERT_FALSE(hasPrefix("", "-"));
}

/* ----------------------------------------------------------------------------
 * toLower
 * --------------------------------------------------------------------------*/

TEST(toLower, schemesAndCommands)
{
    ASSERT_EQ(toLower("OCSS"), "ocss");
    ASSERT_EQ(toLower("DownLoad"), "download");
    ASSERT_EQ(toLower(""), "");
}

TEST(toLower, leavesPunctuation)
{
    ASSERT_EQ(toLower("plasma_LOOK-and.feel~9"), "plasma_look-and.feel~9");
}

TEST(toLower, leavesNonAscii)
{
    ASSERT_EQ(toLower("ÉTÉ"), "ÉTÉ");
}

/* ----------------------------------------------------------------------------
 * chomp
 * --------------------------------------------------------------------------*/

TEST(chomp, trailingWhitespaceOnly)
{
    ASSERT_EQ(chomp("error: bad link \n\n"), "error: bad link");
    ASSERT_EQ(chomp("\t indented"), "\t indented");
}

TEST(chomp, allWhitespace)
{
    ASSERT_EQ(chomp(" \r\n\t"), "");
    ASSERT_EQ(chomp(""), "");
}

/* ----------------------------------------------------------------------------
 * get
 * --------------------------------------------------------------------------*/

TEST(get, missingKey)
{
    StringMap query;

    ASSERT_EQ(get(query, "url"), nullptr);
}

TEST(get, presentKey)
{
    StringMap query{{"url", "https://fake.download/location.png"}, {"type", "music"}};

    auto type = get(query, "type");
    ASSERT_NE(type, nullptr);
    ASSERT_EQ(*type, "music");
}

TEST(get, lookupByStringView)
{
    StringMap query{{"filename", ""}};
    std::string_view key = "filename";

    ASSERT_EQ(*get(query, key), "");
}

} // namespace ocs
