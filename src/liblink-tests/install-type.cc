#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <rapidcheck/gtest.h>

#include "ocs/link/install-type.hh"
#include "ocs/link/tests/parsed-link.hh"
#include "ocs/util/tests/gmock-matchers.hh"

namespace ocs {

/* ----------------------------------------------------------------------------
 * per-family parsing
 * --------------------------------------------------------------------------*/

TEST(parseStyling, aliasesOfThemes)
{
    ASSERT_EQ(parseStyling("xfwm4_themes"), Styling::Themes);
    ASSERT_EQ(parseStyling("openbox_themes"), Styling::Themes);
    ASSERT_EQ(parseStyling("gtk3_themes"), Styling::Themes);
    ASSERT_EQ(parseStyling("themes"), Styling::Themes);
}

TEST(parseStyling, canonicalNames)
{
    ASSERT_EQ(parseStyling("icons"), Styling::Icons);
    ASSERT_EQ(parseStyling("plasma_color_schemes"), Styling::ColorSchemes);
}

TEST(parseStyling, unknown)
{
    EXPECT_THAT(
        []() { parseStyling("bigger farts"); },
        ::testing::Throws<NoMatchingInstallType>(::testing::Field(&NoMatchingInstallType::token, "bigger farts")));
}

TEST(parseStyling, caseSensitive)
{
    ASSERT_THROW(parseStyling("Icons"), NoMatchingInstallType);
}

TEST(parsePersonalMedia, knownTokens)
{
    ASSERT_EQ(parsePersonalMedia("bin"), PersonalMedia::Bin);
    ASSERT_EQ(parsePersonalMedia("music"), PersonalMedia::Music);
    ASSERT_EQ(parsePersonalMedia("pictures"), PersonalMedia::Pictures);
}

TEST(parsePersonalMedia, caseInsensitive)
{
    ASSERT_EQ(parsePersonalMedia("Music"), PersonalMedia::Music);
    ASSERT_EQ(parsePersonalMedia("WALLPAPERS"), PersonalMedia::Wallpapers);
}

TEST(parsePersonalMedia, unknown)
{
    ASSERT_THROW(parsePersonalMedia("farts"), NoMatchingInstallType);
}

TEST(parseWMThemes, aliases)
{
    ASSERT_EQ(parseWMThemes("compiz_themes"), WMThemes::EmeraldThemes);
    ASSERT_EQ(parseWMThemes("beryl_themes"), WMThemes::EmeraldThemes);
    ASSERT_EQ(parseWMThemes("gnome_shell_extensions"), WMThemes::GnomeShellExtensions);
}

TEST(parseQtGeneral, aliases)
{
    ASSERT_EQ(parseQtGeneral("plasma5_plasmoids"), QtGeneral::PlasmaPlasmoids);
    ASSERT_EQ(parseQtGeneral("plasma4_plasmoids"), QtGeneral::PlasmaPlasmoids);
    ASSERT_EQ(parseQtGeneral("plasma5_look_and_feel"), QtGeneral::PlasmaLookAndFeel);
    ASSERT_EQ(parseQtGeneral("plasma5_desktopthemes"), QtGeneral::PlasmaDesktopThemes);
    ASSERT_EQ(parseQtGeneral("kwin_tabbox"), QtGeneral::KwinTabbox);
}

TEST(parseAppSpecific, nautilusScripts)
{
    ASSERT_EQ(parseAppSpecific("nautilus_scripts"), AppSpecific::NautilusScripts);
    ASSERT_THROW(parseAppSpecific("nautilus"), NoMatchingInstallType);
}

/* ----------------------------------------------------------------------------
 * install paths
 * --------------------------------------------------------------------------*/

TEST(installPath, templates)
{
    ASSERT_EQ(installPath(WMThemes::GnomeShellExtensions), "$XDG_DATA_HOME/gnome-shell/extensions");
    ASSERT_EQ(installPath(QtGeneral::KwinTabbox), "$XDG_DATA_HOME/kwin/tabbox");
    ASSERT_EQ(installPath(AppSpecific::NautilusScripts), "$XDG_DATA_HOME/nautilus/scripts");
    ASSERT_EQ(installPath(PersonalMedia::Bin), "$HOME/.local/bin");
    ASSERT_EQ(installPath(Styling::Themes), "$HOME/.themes");
}

TEST(installPath, aliasesShareThePath)
{
    ASSERT_EQ(installPath(parseStyling("cinnamon_themes")), installPath(parseStyling("themes")));
}

TEST(installPath, ofVariant)
{
    InstallType t = QtGeneral::PlasmaLookAndFeel;
    ASSERT_EQ(installPath(t), "$XDG_DATA_HOME/plasma/look-and-feel");
}

/* ----------------------------------------------------------------------------
 * resolveInstallType
 * --------------------------------------------------------------------------*/

TEST(resolveInstallType, triesEveryFamily)
{
    ASSERT_EQ(resolveInstallType("music"), InstallType{PersonalMedia::Music});
    ASSERT_EQ(resolveInstallType("gtk2_themes"), InstallType{Styling::Themes});
    ASSERT_EQ(resolveInstallType("icewm_themes"), InstallType{WMThemes::IceWMThemes});
    ASSERT_EQ(resolveInstallType("plasma_look_and_feel"), InstallType{QtGeneral::PlasmaLookAndFeel});
    ASSERT_EQ(resolveInstallType("nautilus_scripts"), InstallType{AppSpecific::NautilusScripts});
}

TEST(resolveInstallType, personalMediaIsCaseInsensitive)
{
    ASSERT_EQ(resolveInstallType("Books"), InstallType{PersonalMedia::Books});
    ASSERT_THROW(resolveInstallType("Icons"), NoMatchingInstallType);
}

TEST(resolveInstallType, unknownHasSuggestions)
{
    try {
        resolveInstallType("font");
        FAIL() << "expected an exception";
    } catch (NoMatchingInstallType & e) {
        ASSERT_EQ(e.token, "font");
        EXPECT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("no known install type matched 'font'"));
        auto suggestions = e.info().suggestions.trim();
        ASSERT_FALSE(suggestions.suggestions.empty());
        ASSERT_EQ(suggestions.suggestions.begin()->suggestion, "fonts");
    }
}

TEST(resolveInstallType, emptyToken)
{
    ASSERT_THROW(resolveInstallType(""), NoMatchingInstallType);
}

/* ----------------------------------------------------------------------------
 * names
 * --------------------------------------------------------------------------*/

TEST(showInstallType, canonicalNames)
{
    ASSERT_EQ(showInstallType(PersonalMedia::Wallpapers), "wallpapers");
    ASSERT_EQ(showInstallType(Styling::ColorSchemes), "color_schemes");
    ASSERT_EQ(showInstallType(InstallType{QtGeneral::QtCurve}), "qtcurve");
}

TEST(allInstallTypeNames, containsNamesAndAliases)
{
    auto names = allInstallTypeNames();

    ASSERT_TRUE(names.contains("music"));
    ASSERT_TRUE(names.contains("xfwm4_themes"));
    ASSERT_TRUE(names.contains("plasma5_plasmoids"));
    ASSERT_TRUE(names.contains("nautilus_scripts"));
    ASSERT_FALSE(names.contains("farts"));
}

TEST(allInstallTypeNames, everyNameResolves)
{
    for (auto & name : allInstallTypeNames())
        ASSERT_NO_THROW(resolveInstallType(name)) << name;
}

#ifndef COVERAGE

RC_GTEST_PROP(InstallType, prop_show_resolve_round_trip, (const InstallType & t))
{
    RC_ASSERT(resolveInstallType(showInstallType(t)) == t);
}

#endif

} // namespace ocs
