#pragma once

#if defined(__GNUC__)
#define DGRAMIPC_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define DGRAMIPC_UNLIKELY(x) (!!(x))
#endif

#ifdef __GNUC__
#define DGRAMIPC_NOINLINE __attribute__((__noinline__))
#else
#define DGRAMIPC_NOINLINE
#endif
