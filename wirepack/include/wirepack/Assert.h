#pragma once

#include "wirepack/Exports.h"

#include <source_location>

namespace wirepack
{
	class Log;

	WIREPACK_EXPORT Log* setAssertLog(Log* log);

	WIREPACK_EXPORT void
	validateMsg(bool expr, const char* msg, std::source_location loc = std::source_location::current());

	inline void validate(bool expr, std::source_location loc = std::source_location::current())
	{
		validateMsg(expr, nullptr, loc);
	}

	inline void unreachable(std::source_location loc = std::source_location::current())
	{
		validateMsg(false, "unreachable", loc);
	}

	inline void unreachableMsg(const char* msg, std::source_location loc = std::source_location::current())
	{
		validateMsg(false, msg, loc);
	}
}
