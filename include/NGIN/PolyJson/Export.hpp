#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_POLYJSON_STATIC)
    #define NGIN_POLYJSON_API
  #else
    #if defined(NGIN_POLYJSON_EXPORTS)
      #define NGIN_POLYJSON_API __declspec(dllexport)
    #else
      #define NGIN_POLYJSON_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_POLYJSON_API
#endif
