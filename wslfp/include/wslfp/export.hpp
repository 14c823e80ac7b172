#pragma once

// Symbol visibility for the wslfp libraries.

#if defined(__GNUC__) || defined(__clang__)
#   if defined(_WIN32) || defined(__WIN32__) || defined(WIN32) || defined(__CYGWIN__)
#       define WSLFP_SYMBOL_IMPORT __attribute__((__dllimport__))
#       define WSLFP_SYMBOL_EXPORT __attribute__((__dllexport__))
#   else
#       define WSLFP_SYMBOL_EXPORT __attribute__((__visibility__("default")))
#       define WSLFP_SYMBOL_VISIBLE __attribute__((__visibility__("default")))
#   endif
#endif

#ifndef WSLFP_SYMBOL_IMPORT
#   define WSLFP_SYMBOL_IMPORT
#endif
#ifndef WSLFP_SYMBOL_EXPORT
#   define WSLFP_SYMBOL_EXPORT
#endif
#ifndef WSLFP_SYMBOL_VISIBLE
#   define WSLFP_SYMBOL_VISIBLE
#endif

// WSLFP_SHARED_LIBRARY is defined by the build when wslfp is a shared object.
#if defined(wslfp_EXPORTS) || defined(wslfpio_EXPORTS)
#   define WSLFP_API WSLFP_SYMBOL_EXPORT
#elif defined(WSLFP_SHARED_LIBRARY)
#   define WSLFP_API WSLFP_SYMBOL_IMPORT
#else
#   define WSLFP_API
#endif
