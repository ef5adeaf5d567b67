#pragma once

#include "gossamer/config.hh"

#ifdef GOSSAMER_ENABLE_ASSERTIONS

#  include <cstdio>
#  include <cstdlib>

#  define GOSSAMER_ASSERT(stmt)                                                \
    if (!static_cast<bool>(stmt)) {                                            \
      fprintf(stderr, "%s:%u: assertion failed '%s'\n", __FILE__, __LINE__,    \
              #stmt);                                                          \
      ::abort();                                                               \
    }                                                                          \
    static_cast<void>(0)

#else

#  define GOSSAMER_ASSERT(unused) static_cast<void>(0)

#endif
