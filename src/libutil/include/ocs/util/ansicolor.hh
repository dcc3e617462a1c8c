#pragma once
///@file

/* Escape sequences spliced into message literals, e.g.
   `ANSI_RED "error:" ANSI_NORMAL`. Without OCS_COLOR they are empty. */

#ifdef OCS_COLOR
#  define ANSI_NORMAL "\x1b[0m"
#  define ANSI_RED "\x1b[31;1m"
#  define ANSI_GREEN "\x1b[32;1m"
#  define ANSI_WARNING "\x1b[35;1m"
#else
#  define ANSI_NORMAL ""
#  define ANSI_RED ""
#  define ANSI_GREEN ""
#  define ANSI_WARNING ""
#endif
