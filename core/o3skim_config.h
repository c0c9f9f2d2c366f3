#ifndef o3skim_config_h
#define o3skim_config_h

/// @file

// the version string is provided by the build system
#if !defined(O3SKIM_VERSION_DESCR)
#define O3SKIM_VERSION_DESCR "0.1.0"
#endif

#if defined(_WIN32)
#define O3SKIM_EXPORT
#else
#define O3SKIM_EXPORT __attribute__ ((visibility ("default")))
#endif

#endif
