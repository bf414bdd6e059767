/*

config.hpp
----------

Global build configuration for emlxx.

Define EMLXX_NO_EXCEPTIONS to disable the exception-based wrappers of
throwing.hpp. The extraction pipeline itself reports every failure through
emlxx::result and never lets an exception escape.

*/

#pragma once

#if defined(EMLXX_NO_EXCEPTIONS)
#define EMLXX_THROWING_ENABLED 0
#else
#define EMLXX_THROWING_ENABLED 1
#endif
