#include "ocs/link/install-type.hh"
#include "ocs/util/strings.hh"
#include "ocs/util/util.hh"

#include <array>

namespace ocs {

template<typename T>
struct InstallTypeDetails
{
    T tag;
    std::string_view name;
    std::string_view path;
};

template<typename T>
struct InstallTypeAlias
{
    std::string_view alias;
    T tag;
};

/**
 * The details arrays are indexed by enum tag; each one must list the
 * enum in declaration order.
 */
template<typename T, size_t N>
constexpr bool inTagOrder(const std::array<InstallTypeDetails<T>, N> & details)
{
    for (size_t i = 0; i < N; ++i)
        if (static_cast<size_t>(details[i].tag) != i)
            return false;
    return true;
}

constexpr std::array<InstallTypeDetails<PersonalMedia>, 9> personalMediaDetails = {{
    {PersonalMedia::Bin, "bin", "$HOME/.local/bin"},
    {PersonalMedia::Books, "books", "$APP_DATA/books"},
    {PersonalMedia::Comics, "comics", "$APP_DATA/comics"},
    {PersonalMedia::Documents, "documents", "$HOME/Documents"},
    {PersonalMedia::Downloads, "downloads", "$HOME/Downloads"},
    {PersonalMedia::Music, "music", "$HOME/Music"},
    {PersonalMedia::Pictures, "pictures", "$HOME/Pictures"},
    {PersonalMedia::Videos, "videos", "$HOME/Videos"},
    {PersonalMedia::Wallpapers, "wallpapers", "$XDG_DATA_HOME/wallpapers"},
}};

constexpr std::array<InstallTypeDetails<Styling>, 6> stylingDetails = {{
    {Styling::ColorSchemes, "color_schemes", "$XDG_DATA_HOME/color-schemes"},
    {Styling::Cursors, "cursors", "$HOME/.icons"},
    {Styling::Emoticons, "emoticons", "$XDG_DATA_HOME/emoticons"},
    {Styling::Fonts, "fonts", "$HOME/.fonts"},
    {Styling::Icons, "icons", "$XDG_DATA_HOME/icons"},
    {Styling::Themes, "themes", "$HOME/.themes"},
}};

constexpr std::array<InstallTypeAlias<Styling>, 8> stylingAliases = {{
    {"plasma_color_schemes", Styling::ColorSchemes},
    {"gnome_shell_themes", Styling::Themes},
    {"cinnamon_themes", Styling::Themes},
    {"gtk2_themes", Styling::Themes},
    {"gtk3_themes", Styling::Themes},
    {"metacity_themes", Styling::Themes},
    {"xfwm4_themes", Styling::Themes},
    {"openbox_themes", Styling::Themes},
}};

constexpr std::array<InstallTypeDetails<WMThemes>, 11> wmThemesDetails = {{
    {WMThemes::CairoClockThemes, "cairo_clock_themes", "$HOME/.cairo-clock/themes"},
    {WMThemes::CinnamonApplets, "cinnamon_applets", "$XDG_DATA_HOME/cinnamon/applets"},
    {WMThemes::CinnamonDesklets, "cinnamon_desklets", "$XDG_DATA_HOME/cinnamon/desklets"},
    {WMThemes::CinnamonExtensions, "cinnamon_extensions", "$XDG_DATA_HOME/cinnamon/extensions"},
    {WMThemes::EmeraldThemes, "emerald_themes", "$HOME/.emerald/themes"},
    {WMThemes::EnlightenmentBackgrounds, "enlightenment_backgrounds", "$HOME/.e/e/backgrounds"},
    {WMThemes::EnlightenmentThemes, "enlightenment_themes", "$HOME/.e/e/themes"},
    {WMThemes::FluxboxStyles, "fluxbox_styles", "$HOME/.fluxbox/styles"},
    {WMThemes::GnomeShellExtensions, "gnome_shell_extensions", "$XDG_DATA_HOME/gnome-shell/extensions"},
    {WMThemes::IceWMThemes, "icewm_themes", "$HOME/.icewm/themes"},
    {WMThemes::PekWMThemes, "pekwm_themes", "$HOME/.pekwm/themes"},
}};

constexpr std::array<InstallTypeAlias<WMThemes>, 2> wmThemesAliases = {{
    {"compiz_themes", WMThemes::EmeraldThemes},
    {"beryl_themes", WMThemes::EmeraldThemes},
}};

constexpr std::array<InstallTypeDetails<QtGeneral>, 11> qtGeneralDetails = {{
    {QtGeneral::AmarokScripts, "amarok_scripts", "$KDEHOME/share/apps/amarok/scripts"},
    {QtGeneral::AuroraeThemes, "aurorae_themes", "$XDG_DATA_HOME/aurorae/themes"},
    {QtGeneral::DekoratorThemes, "dekorator_themes", "$XDG_DATA_HOME/deKorator/themes"},
    {QtGeneral::KwinEffects, "kwin_effects", "$XDG_DATA_HOME/kwin/effects"},
    {QtGeneral::KwinScripts, "kwin_scripts", "$XDG_DATA_HOME/kwin/scripts"},
    {QtGeneral::KwinTabbox, "kwin_tabbox", "$XDG_DATA_HOME/kwin/tabbox"},
    {QtGeneral::PlasmaDesktopThemes, "plasma_desktopthemes", "$XDG_DATA_HOME/plasma/desktoptheme"},
    {QtGeneral::PlasmaLookAndFeel, "plasma_look_and_feel", "$XDG_DATA_HOME/plasma/look-and-feel"},
    {QtGeneral::PlasmaPlasmoids, "plasma_plasmoids", "$XDG_DATA_HOME/plasma/plasmoids"},
    {QtGeneral::QtCurve, "qtcurve", "$XDG_DATA_HOME/QtCurve"},
    {QtGeneral::YakuakeSkins, "yakuake_skins", "$KDEHOME/share/apps/yakuake/skins"},
}};

constexpr std::array<InstallTypeAlias<QtGeneral>, 4> qtGeneralAliases = {{
    {"plasma4_plasmoids", QtGeneral::PlasmaPlasmoids},
    {"plasma5_plasmoids", QtGeneral::PlasmaPlasmoids},
    {"plasma5_look_and_feel", QtGeneral::PlasmaLookAndFeel},
    {"plasma5_desktopthemes", QtGeneral::PlasmaDesktopThemes},
}};

constexpr std::array<InstallTypeDetails<AppSpecific>, 1> appSpecificDetails = {{
    {AppSpecific::NautilusScripts, "nautilus_scripts", "$XDG_DATA_HOME/nautilus/scripts"},
}};

static_assert(inTagOrder(personalMediaDetails), "array order does not match enum tag order");
static_assert(inTagOrder(stylingDetails), "array order does not match enum tag order");
static_assert(inTagOrder(wmThemesDetails), "array order does not match enum tag order");
static_assert(inTagOrder(qtGeneralDetails), "array order does not match enum tag order");
static_assert(inTagOrder(appSpecificDetails), "array order does not match enum tag order");

template<typename T, size_t N, size_t M = 0>
static std::optional<T> lookup(
    const std::array<InstallTypeDetails<T>, N> & details,
    std::string_view token,
    const std::array<InstallTypeAlias<T>, M> & aliases = {})
{
    for (auto & d : details)
        if (d.name == token)
            return d.tag;
    for (auto & a : aliases)
        if (a.alias == token)
            return a.tag;
    return std::nullopt;
}

template<typename T, size_t N>
static const InstallTypeDetails<T> & detailsOf(const std::array<InstallTypeDetails<T>, N> & details, T tag)
{
    auto i = static_cast<size_t>(tag);
    if (i >= N)
        unreachable();
    return details[i];
}

NoMatchingInstallType::NoMatchingInstallType(std::string token, const Suggestions & suggestions)
    : Error(suggestions, "no known install type matched '%s'", token)
    , token(std::move(token))
{
}

PersonalMedia parsePersonalMedia(std::string_view token)
{
    if (auto tag = lookup(personalMediaDetails, toLower(std::string(token))))
        return *tag;
    throw NoMatchingInstallType(std::string(token));
}

Styling parseStyling(std::string_view token)
{
    if (auto tag = lookup(stylingDetails, token, stylingAliases))
        return *tag;
    throw NoMatchingInstallType(std::string(token));
}

WMThemes parseWMThemes(std::string_view token)
{
    if (auto tag = lookup(wmThemesDetails, token, wmThemesAliases))
        return *tag;
    throw NoMatchingInstallType(std::string(token));
}

QtGeneral parseQtGeneral(std::string_view token)
{
    if (auto tag = lookup(qtGeneralDetails, token, qtGeneralAliases))
        return *tag;
    throw NoMatchingInstallType(std::string(token));
}

AppSpecific parseAppSpecific(std::string_view token)
{
    if (auto tag = lookup(appSpecificDetails, token))
        return *tag;
    throw NoMatchingInstallType(std::string(token));
}

std::string_view installPath(PersonalMedia tag)
{
    return detailsOf(personalMediaDetails, tag).path;
}

std::string_view installPath(Styling tag)
{
    return detailsOf(stylingDetails, tag).path;
}

std::string_view installPath(WMThemes tag)
{
    return detailsOf(wmThemesDetails, tag).path;
}

std::string_view installPath(QtGeneral tag)
{
    return detailsOf(qtGeneralDetails, tag).path;
}

std::string_view installPath(AppSpecific tag)
{
    return detailsOf(appSpecificDetails, tag).path;
}

std::string_view installPath(const InstallType & installType)
{
    return std::visit([](auto tag) { return installPath(tag); }, installType);
}

std::string_view showInstallType(PersonalMedia tag)
{
    return detailsOf(personalMediaDetails, tag).name;
}

std::string_view showInstallType(Styling tag)
{
    return detailsOf(stylingDetails, tag).name;
}

std::string_view showInstallType(WMThemes tag)
{
    return detailsOf(wmThemesDetails, tag).name;
}

std::string_view showInstallType(QtGeneral tag)
{
    return detailsOf(qtGeneralDetails, tag).name;
}

std::string_view showInstallType(AppSpecific tag)
{
    return detailsOf(appSpecificDetails, tag).name;
}

std::string_view showInstallType(const InstallType & installType)
{
    return std::visit([](auto tag) { return showInstallType(tag); }, installType);
}

InstallType resolveInstallType(std::string_view token)
{
    if (auto tag = lookup(personalMediaDetails, toLower(std::string(token))))
        return *tag;
    if (auto tag = lookup(stylingDetails, token, stylingAliases))
        return *tag;
    if (auto tag = lookup(wmThemesDetails, token, wmThemesAliases))
        return *tag;
    if (auto tag = lookup(qtGeneralDetails, token, qtGeneralAliases))
        return *tag;
    if (auto tag = lookup(appSpecificDetails, token))
        return *tag;
    throw NoMatchingInstallType(std::string(token), Suggestions::bestMatches(allInstallTypeNames(), token));
}

StringSet allInstallTypeNames()
{
    StringSet res;
    auto addNames = [&](const auto & details) {
        for (auto & d : details)
            res.emplace(d.name);
    };
    auto addAliases = [&](const auto & aliases) {
        for (auto & a : aliases)
            res.emplace(a.alias);
    };
    addNames(personalMediaDetails);
    addNames(stylingDetails);
    addAliases(stylingAliases);
    addNames(wmThemesDetails);
    addAliases(wmThemesAliases);
    addNames(qtGeneralDetails);
    addAliases(qtGeneralAliases);
    addNames(appSpecificDetails);
    return res;
}

std::ostream & operator<<(std::ostream & str, const InstallType & installType)
{
    return str << showInstallType(installType);
}

} // namespace ocs
