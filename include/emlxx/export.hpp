#pragma once

#if defined(EMLXX_STATIC_DEFINE)
#  ifndef EMLXX_EXPORT
#    define EMLXX_EXPORT
#  endif
#  ifndef EMLXX_NO_EXPORT
#    define EMLXX_NO_EXPORT
#  endif
#else
#  ifndef EMLXX_EXPORT
#    if defined(_WIN32) || defined(__CYGWIN__)
#      ifdef EMLXX_EXPORTS
#        define EMLXX_EXPORT __declspec(dllexport)
#      else
#        define EMLXX_EXPORT __declspec(dllimport)
#      endif
#      define EMLXX_NO_EXPORT
#    else
#      if defined(__GNUC__) && __GNUC__ >= 4
#        define EMLXX_EXPORT __attribute__((visibility("default")))
#        define EMLXX_NO_EXPORT __attribute__((visibility("hidden")))
#      else
#        define EMLXX_EXPORT
#        define EMLXX_NO_EXPORT
#      endif
#    endif
#  endif
#endif
