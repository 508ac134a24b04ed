
#ifndef AFFECT_SDK_EXPORT_H
#define AFFECT_SDK_EXPORT_H

#ifdef AFFECT_SDK_STATIC_DEFINE
#  define AFFECT_SDK_EXPORT
#  define AFFECT_SDK_NO_EXPORT
#else
#  ifndef AFFECT_SDK_EXPORT
#    ifdef affect_sdk_EXPORTS
        /* We are building this library */
#      define AFFECT_SDK_EXPORT __attribute__((visibility("default")))
#    else
        /* We are using this library */
#      define AFFECT_SDK_EXPORT __attribute__((visibility("default")))
#    endif
#  endif

#  ifndef AFFECT_SDK_NO_EXPORT
#    define AFFECT_SDK_NO_EXPORT __attribute__((visibility("hidden")))
#  endif
#endif

#ifndef AFFECT_SDK_DEPRECATED
#  define AFFECT_SDK_DEPRECATED __attribute__ ((__deprecated__))
#endif

#ifndef AFFECT_SDK_DEPRECATED_EXPORT
#  define AFFECT_SDK_DEPRECATED_EXPORT AFFECT_SDK_EXPORT AFFECT_SDK_DEPRECATED
#endif

#endif /* AFFECT_SDK_EXPORT_H */
