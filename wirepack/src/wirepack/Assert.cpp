#include "wirepack/Assert.h"
#include "wirepack/Mallocator.h"
#include "wirepack/Log.h"

#include <cpptrace/cpptrace.hpp>

namespace wirepack
{
	inline Log* defaultAssertLog()
	{
		static Mallocator mallocator;
		static Log log{&mallocator};
		return &log;
	}

	inline Log* ASSERT_LOG = nullptr;

	Log* setAssertLog(Log* log)
	{
		auto res = ASSERT_LOG;
		ASSERT_LOG = log;
		return res;
	}

	void validateMsg(bool expr, const char* msg, std::source_location loc)
	{
		#ifdef WIREPACK_ENABLE_ASSERTS
			if (expr)
				return;

			auto log = ASSERT_LOG ? ASSERT_LOG : defaultAssertLog();
			auto file = loc.file_name();
			auto function = loc.function_name();
			auto line = loc.line();
			if (msg)
				log->critical("Assertion Failure: {}, message: {}, in file: {}, function: {}, line: {}"_sv, expr, msg, file, function, line);
			else
				log->critical("Assertion Failure: {}, in file: {}, function: {}, line: {}"_sv, expr, file, function, line);

			auto trace = cpptrace::generate_trace(1, 20).to_string();
			log->critical("{}"_sv, trace);

			#if WIREPACK_COMPILER_MSVC
				__debugbreak();
			#else
				__builtin_trap();
			#endif
		#else
			(void)expr;
			(void)msg;
			(void)loc;
		#endif
	}
}
