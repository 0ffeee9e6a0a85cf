#pragma once

#include <cstring>

// User can specify a "profiling include" to specify how profiling needs to be done
#ifdef RXSCHED_PROFILING_INCLUDE
#include RXSCHED_PROFILING_INCLUDE
#endif

#if TRACY_ENABLE

#include "Tracy.hpp"

#define RXSCHED_ENABLE_PROFILING 1

#define RXSCHED_PROFILING_INIT() static_cast<void>(tracy::GetProfiler())
#define RXSCHED_PROFILING_FUNCTION() ZoneScopedN(__FUNCTION__)
#define RXSCHED_PROFILING_SCOPE_N(staticName) ZoneScopedN(staticName)
#define RXSCHED_PROFILING_SCOPE_C(color) ZoneScopedC(color)
#define RXSCHED_PROFILING_MESSAGE(text) TracyMessage(text, strlen(text))
#define RXSCHED_PROFILING_SETTHREADNAME(staticName) tracy::SetThreadName(staticName)

#define RXSCHED_PROFILING_COLOR_SILVER 0xC0C0C0

#endif

#if !RXSCHED_ENABLE_PROFILING

#define RXSCHED_PROFILING_INIT()                      /*nothing*/
#define RXSCHED_PROFILING_FUNCTION()                  /*nothing*/
#define RXSCHED_PROFILING_SCOPE_N(staticName)         /*nothing*/
#define RXSCHED_PROFILING_SCOPE_C(color)              /*nothing*/
#define RXSCHED_PROFILING_MESSAGE(text)               /*nothing*/
#define RXSCHED_PROFILING_SETTHREADNAME(staticName)   /*nothing*/

#define RXSCHED_PROFILING_COLOR_SILVER /*nothing*/

#endif
