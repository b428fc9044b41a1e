#pragma once

#if defined(_WIN32) && defined(ANIMKIT_CORE_SHARED)
  #if defined(ANIMKIT_CORE_BUILDING)
    #define ANIMKIT_CORE_API __declspec(dllexport)
  #else
    #define ANIMKIT_CORE_API __declspec(dllimport)
  #endif
#else
  #define ANIMKIT_CORE_API
#endif
