#pragma once

#if defined(__GNUC__)
#define TNC_LIKELY(x) (__builtin_expect(!!(x), 1))
#define TNC_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define TNC_LIKELY(x) (!!(x))
#define TNC_UNLIKELY(x) (!!(x))
#endif
