#pragma once

#if defined(_MSC_VER)
# define MBASE_PLATFORM_WINDOWS 1
# define MBASE_PLATFORM_LINUX   0
# define MBASE_PLATFORM_ANDROID 0
# define MBASE_PLATFORM_WEB     0
#elif defined(__ANDROID__)
# define MBASE_PLATFORM_WINDOWS 0
# define MBASE_PLATFORM_LINUX   0
# define MBASE_PLATFORM_ANDROID 1
# define MBASE_PLATFORM_WEB     0
// __linux__ is also defined on Android, hence the order of the checks.
#elif __linux__
# define MBASE_PLATFORM_WINDOWS 0
# define MBASE_PLATFORM_LINUX   1
# define MBASE_PLATFORM_ANDROID 0
# define MBASE_PLATFORM_WEB     0
#elif defined(__EMSCRIPTEN__)
# define MBASE_PLATFORM_WINDOWS 0
# define MBASE_PLATFORM_LINUX   0
# define MBASE_PLATFORM_ANDROID 0
# define MBASE_PLATFORM_WEB     1
#else
# define MBASE_PLATFORM_WINDOWS 0
# define MBASE_PLATFORM_LINUX   0
# define MBASE_PLATFORM_ANDROID 0
# define MBASE_PLATFORM_WEB     0
#endif

#define MBASE_PLATFORM_DESKTOP (MBASE_PLATFORM_WINDOWS || MBASE_PLATFORM_LINUX)
