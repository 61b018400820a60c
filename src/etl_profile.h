#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// GridLink host tools - ETL profile
// Host build: the STL is available and used alongside ETL containers.
// ETL itself never throws; contract violations are checked in debug builds.

#define ETL_NO_EXCEPTIONS
#define ETL_VERBOSE_ERRORS
#define ETL_CHECK_PUSH_POP

#if defined(__clang__)
  #define ETL_COMPILER_CLANG
#elif defined(__GNUC__)
  #define ETL_COMPILER_GCC
#else
  #define ETL_COMPILER_GENERIC
  #define ETL_CPP11_SUPPORTED 1
#endif

#endif
