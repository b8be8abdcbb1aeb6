#pragma once

#if defined(TRIAGEXX_STATIC_DEFINE)
#  ifndef TRIAGEXX_EXPORT
#    define TRIAGEXX_EXPORT
#  endif
#  ifndef TRIAGEXX_NO_EXPORT
#    define TRIAGEXX_NO_EXPORT
#  endif
#else
#  ifndef TRIAGEXX_EXPORT
#    if defined(_WIN32) || defined(__CYGWIN__)
#      ifdef TRIAGEXX_EXPORTS
#        define TRIAGEXX_EXPORT __declspec(dllexport)
#      else
#        define TRIAGEXX_EXPORT __declspec(dllimport)
#      endif
#      define TRIAGEXX_NO_EXPORT
#    else
#      if defined(__GNUC__) && __GNUC__ >= 4
#        define TRIAGEXX_EXPORT __attribute__((visibility("default")))
#        define TRIAGEXX_NO_EXPORT __attribute__((visibility("hidden")))
#      else
#        define TRIAGEXX_EXPORT
#        define TRIAGEXX_NO_EXPORT
#      endif
#    endif
#  endif
#endif
