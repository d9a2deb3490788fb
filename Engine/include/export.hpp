#pragma once

#if defined(_WIN32)
    #if defined(REEF_EXPORT)
        #define REEF_API __declspec(dllexport)
    #else
        #define REEF_API __declspec(dllimport)
    #endif
#else
    #define REEF_API __attribute__((visibility("default")))
#endif
