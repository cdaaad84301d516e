#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define SPINDLE_ALWAYS_INLINE inline __attribute__((always_inline))
#define SPINDLE_NOINLINE __attribute__((noinline))
#else
#define SPINDLE_ALWAYS_INLINE inline
#define SPINDLE_NOINLINE
#endif

#ifndef SPINDLE_BASE_API
#if defined(SPINDLE_BASE_SHARED_BUILD) || defined(SPINDLE_BASE_SHARED)
#define SPINDLE_BASE_API __attribute__((visibility("default")))
#else
#define SPINDLE_BASE_API
#endif
#define SPINDLE_BASE_LOCAL __attribute__((visibility("hidden")))
#endif
#ifndef SPINDLE_BASE_LOCAL
#define SPINDLE_BASE_LOCAL
#endif

namespace Spindle
{

    [[noreturn]] inline void Unreachable()
    {
        __builtin_unreachable();
    }

}// namespace Spindle
