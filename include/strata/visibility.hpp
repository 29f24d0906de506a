#pragma once

// Shared library visibility macros:
//
// STRATA_API - public symbol (exported from shared library)
// STRATA_LOCAL - private symbol (not visible outside shared library)
//
// The library is built with `-fvisibility=hidden`, so the latter is
// needed only to hide private parts of exported classes.

#ifndef _WIN32
	#define STRATA_API __attribute__((visibility("default")))
	#define STRATA_LOCAL __attribute__((visibility("hidden")))
#else
	#ifdef STRATA_EXPORTS
		#define STRATA_API __declspec(dllexport)
	#else
		#define STRATA_API __declspec(dllimport)
	#endif
	#define STRATA_LOCAL
#endif
