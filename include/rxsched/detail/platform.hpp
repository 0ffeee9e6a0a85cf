#pragma once

// User can specify a "platform include" that can override everything that's in here
#ifdef RXSCHED_PLATFORM_INCLUDE
#include RXSCHED_PLATFORM_INCLUDE
#endif

// Detect the platform (if we were not given one)
#ifndef RXSCHED_PLATFORM

#if __APPLE__
#define RXSCHED_PLATFORM_APPLE 1
#elif __linux__ || __FreeBSD__ || __NetBSD__ || __OpenBSD__
#define RXSCHED_PLATFORM_LINUX 1
#elif _MSC_VER || __MINGW64__ || __MINGW32__
#define RXSCHED_PLATFORM_WINDOWS 1
#else
#define RXSCHED_PLATFORM_UNKNOWN 1
#endif

#define RXSCHED_PLATFORM(X) (RXSCHED_PLATFORM_##X)
#endif
