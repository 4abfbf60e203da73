#pragma once

#if defined(_WIN32)
    #if defined(REPEALER_EXPORT)
        #define REPEALER_API __declspec(dllexport)
    #else
        #define REPEALER_API __declspec(dllimport)
    #endif
#else
    #define REPEALER_API __attribute__((visibility("default")))
#endif
