#pragma once

// Platform detection. GOSSAMER_ENABLE_ASSERTIONS is set by the build system.

#if defined(__APPLE__)
#  define GOSSAMER_APPLE
#  define GOSSAMER_MACOS
#elif defined(__linux__)
#  define GOSSAMER_LINUX
#elif defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#  define GOSSAMER_BSD
#elif defined(_WIN32)
#  define GOSSAMER_WINDOWS
#else
#  error Platform and/or compiler not supported
#endif

#if defined(GOSSAMER_LINUX) || defined(GOSSAMER_BSD) || defined(GOSSAMER_APPLE)
#  define GOSSAMER_POSIX
#endif
