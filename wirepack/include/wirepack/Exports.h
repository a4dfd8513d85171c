#pragma once

#if defined(_MSC_VER)
	#define WIREPACK_COMPILER_MSVC 1
#elif defined(__clang__)
	#define WIREPACK_COMPILER_CLANG 1
#elif defined(__GNUC__)
	#define WIREPACK_COMPILER_GNU 1
#endif

#if defined(WIREPACK_SHARED)
	#if WIREPACK_COMPILER_MSVC
		#if defined(WIREPACK_BUILD)
			#define WIREPACK_EXPORT __declspec(dllexport)
		#else
			#define WIREPACK_EXPORT __declspec(dllimport)
		#endif
	#else
		#define WIREPACK_EXPORT __attribute__((visibility("default")))
	#endif
#else
	#define WIREPACK_EXPORT
#endif
