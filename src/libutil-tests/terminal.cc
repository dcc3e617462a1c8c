#include "ocs/util/terminal.hh"

#include <gtest/gtest.h>

namespace ocs {

/* ----------------------------------------------------------------------------
 * filterANSIEscapes
 * --------------------------------------------------------------------------*/

TEST(filterANSIEscapes, plainTextIsUnchanged)
{
    ASSERT_EQ(filterANSIEscapes(""), "");
    ASSERT_EQ(filterANSIEscapes("ocs://install?type=icons"), "ocs://install?type=icons");
}

TEST(filterANSIEscapes, errorPrefix)
{
    auto s = "\x1b[31;1merror:\x1b[0m no links given";

    ASSERT_EQ(filterANSIEscapes(s), s);
    ASSERT_EQ(filterANSIEscapes(s, true), "error: no links given");
}

TEST(filterANSIEscapes, nonColourSequencesAreAlwaysDropped)
{
    /* Cursor movement and erase-line. */
    auto s = "\x1b[2Kdownloading\x1b[1A";

    ASSERT_EQ(filterANSIEscapes(s), "downloading");
}

TEST(filterANSIEscapes, escapesDoNotCountTowardsWidth)
{
    auto s = "\x1b[35;1mplasma\x1b[0m_themes";

    ASSERT_EQ(filterANSIEscapes(s, true, 8), "plasma_t");
    ASSERT_EQ(filterANSIEscapes(s, false, 3), "\x1b[35;1mpla");
}

TEST(filterANSIEscapes, tabsAlignToEightColumns)
{
    ASSERT_EQ(filterANSIEscapes("url\ttype", true), "url     type");
    ASSERT_EQ(filterANSIEscapes("\tx", true, 4), "    ");
}

TEST(filterANSIEscapes, carriageReturnAndBellAreDropped)
{
    ASSERT_EQ(filterANSIEscapes("line\r\a", true), "line");
}

TEST(filterANSIEscapes, multibyteCharactersCountOnce)
{
    ASSERT_EQ(filterANSIEscapes("été.png", true, 3), "été");
    ASSERT_EQ(filterANSIEscapes("円円円", true, 2), "円円");
    ASSERT_EQ(filterANSIEscapes("a🎨b", true, 2), "a🎨");
}

} // namespace ocs
