#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(MORPH_MAPPING_STATIC)
    #define MORPH_MAPPING_API
  #else
    #if defined(MORPH_MAPPING_EXPORTS)
      #define MORPH_MAPPING_API __declspec(dllexport)
    #else
      #define MORPH_MAPPING_API __declspec(dllimport)
    #endif
  #endif
#else
  #define MORPH_MAPPING_API
#endif
