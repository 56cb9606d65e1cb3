#pragma once

#if defined _WIN32 || defined __CYGWIN__
#ifdef atomvec_EXPORTS
#ifdef __GNUC__
#define ATOMVEC_EXPORT __attribute__ ((dllexport))
#else
#define ATOMVEC_EXPORT __declspec(dllexport)
#define ATOMVEC_DLL_WARNING_DISABLE_4251
#endif
#else
#ifdef __GNUC__
#define ATOMVEC_EXPORT __attribute__ ((dllimport))
#else
#define ATOMVEC_EXPORT __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define ATOMVEC_EXPORT __attribute__ ((visibility ("default")))
#else
#define ATOMVEC_EXPORT
#endif
#endif

#ifdef ATOMVEC_DLL_WARNING_DISABLE_4251
#pragma warning( disable : 4251 )
#pragma warning( disable : 4275 )
#endif
