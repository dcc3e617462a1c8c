#pragma once
/**
 * @file
 *
 * The registry of install types: the symbolic `type=` tokens of OCS
 * links, grouped into five families, and the install path template
 * of each.
 *
 * Path templates are returned verbatim; variables like `$HOME`,
 * `$XDG_DATA_HOME`, `$KDEHOME` and `$APP_DATA` are left for the caller
 * to expand.
 *
 * Token matching is case-insensitive for `PersonalMedia` and
 * case-sensitive for every other family.
 */

#include "ocs/util/error.hh"
#include "ocs/util/types.hh"

#include <variant>

namespace ocs {

enum struct PersonalMedia {
    Bin,
    Books,
    Comics,
    Documents,
    Downloads,
    Music,
    Pictures,
    Videos,
    Wallpapers,
};

enum struct Styling {
    ColorSchemes,
    Cursors,
    Emoticons,
    Fonts,
    Icons,
    Themes,
};

enum struct WMThemes {
    CairoClockThemes,
    CinnamonApplets,
    CinnamonDesklets,
    CinnamonExtensions,
    EmeraldThemes,
    EnlightenmentBackgrounds,
    EnlightenmentThemes,
    FluxboxStyles,
    GnomeShellExtensions,
    IceWMThemes,
    PekWMThemes,
};

/**
 * KDE / Qt desktop assets.
 */
enum struct QtGeneral {
    AmarokScripts,
    AuroraeThemes,
    DekoratorThemes,
    KwinEffects,
    KwinScripts,
    KwinTabbox,
    PlasmaDesktopThemes,
    PlasmaLookAndFeel,
    PlasmaPlasmoids,
    QtCurve,
    YakuakeSkins,
};

enum struct AppSpecific {
    NautilusScripts,
};

using InstallType = std::variant<PersonalMedia, Styling, WMThemes, QtGeneral, AppSpecific>;

class NoMatchingInstallType : public Error
{
public:
    std::string token;

    NoMatchingInstallType(std::string token, const Suggestions & suggestions = {});
};

/**
 * Parse a token of one family, canonical name or alias.
 *
 * @throws NoMatchingInstallType
 */
PersonalMedia parsePersonalMedia(std::string_view token);
Styling parseStyling(std::string_view token);
WMThemes parseWMThemes(std::string_view token);
QtGeneral parseQtGeneral(std::string_view token);
AppSpecific parseAppSpecific(std::string_view token);

std::string_view installPath(PersonalMedia);
std::string_view installPath(Styling);
std::string_view installPath(WMThemes);
std::string_view installPath(QtGeneral);
std::string_view installPath(AppSpecific);
std::string_view installPath(const InstallType & installType);

/**
 * The canonical token; the inverse of the `parse*()` functions for
 * everything but aliases.
 */
std::string_view showInstallType(PersonalMedia);
std::string_view showInstallType(Styling);
std::string_view showInstallType(WMThemes);
std::string_view showInstallType(QtGeneral);
std::string_view showInstallType(AppSpecific);
std::string_view showInstallType(const InstallType & installType);

/**
 * Try every family in the order `PersonalMedia`, `Styling`,
 * `WMThemes`, `QtGeneral`, `AppSpecific`; the first match wins.
 *
 * @throws NoMatchingInstallType with the closest known tokens as
 * suggestions.
 */
InstallType resolveInstallType(std::string_view token);

/**
 * Every canonical token and every alias.
 */
StringSet allInstallTypeNames();

std::ostream & operator<<(std::ostream & str, const InstallType & installType);

} // namespace ocs
