// perf.hpp — compiler hints for the sweep hot path
#pragma once

#if defined(__GNUC__) || defined(__clang__)
#  define PERF_HOT   __attribute__((hot))
#  define PERF_ALWAYS_INLINE inline __attribute__((always_inline))
#  define PERF_LIKELY(x)   (__builtin_expect(!!(x), 1))
#  define PERF_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#  define PERF_RESTRICT __restrict__
#else
#  define PERF_HOT
#  define PERF_ALWAYS_INLINE inline
#  define PERF_LIKELY(x)   (x)
#  define PERF_UNLIKELY(x) (x)
#  define PERF_RESTRICT
#endif
