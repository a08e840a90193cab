#pragma once

// always inline
#ifdef _MSC_VER
    #define TEXTCLEAN_ALWAYSINLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
    #define TEXTCLEAN_ALWAYSINLINE inline __attribute__((__always_inline__))
#else
    #define TEXTCLEAN_ALWAYSINLINE inline
#endif
