#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_ATTRIBUTES_STATIC)
    #define NGIN_ATTRIBUTES_API
  #else
    #if defined(NGIN_ATTRIBUTES_EXPORTS)
      #define NGIN_ATTRIBUTES_API __declspec(dllexport)
    #else
      #define NGIN_ATTRIBUTES_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_ATTRIBUTES_API
#endif

