/*

config.hpp
----------

Global build configuration for triagexx.

Define TRIAGEXX_USE_STD_REGEX to use <regex> instead of Boost.Regex.

*/

#pragma once

#if defined(TRIAGEXX_USE_STD_REGEX)
#undef TRIAGEXX_USE_STD_REGEX
#define TRIAGEXX_USE_STD_REGEX 1
#else
#define TRIAGEXX_USE_STD_REGEX 0
#endif
