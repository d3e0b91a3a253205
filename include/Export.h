#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
    #ifdef SNAPI_GRAPHBUNDLE_EXPORTS
        #define SNAPI_GRAPHBUNDLE_API __declspec(dllexport)
    #else
        #define SNAPI_GRAPHBUNDLE_API __declspec(dllimport)
    #endif
#else
    #if __GNUC__ >= 4
        #define SNAPI_GRAPHBUNDLE_API __attribute__((visibility("default")))
    #else
        #define SNAPI_GRAPHBUNDLE_API
    #endif
#endif
