#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(RDLINK_EXPORTS)
    #define RDL_API __declspec(dllexport)
  #elif defined(RDLINK_SHARED)
    #define RDL_API __declspec(dllimport)
  #else
    #define RDL_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define RDL_API __attribute__((visibility("default")))
#else
  #define RDL_API
#endif
