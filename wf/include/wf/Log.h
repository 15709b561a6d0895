#pragma once

#include "wf/Context.h"
#include "wf/Fmt.h"


namespace wf
{
	// logs a message with debug level, it will be disabled in release mode
	template<typename... TArgs>
	inline static void
	log_debug([[maybe_unused]] const char* fmt, [[maybe_unused]] TArgs&&... args)
	{
		#ifdef DEBUG
		auto msg = wf::str_tmpf(fmt, args...);
		_log_debug_str(msg.ptr);
		#endif
	}


	// logs a message with warning level
	template<typename... TArgs>
	inline static void
	log_warning(const char* fmt, TArgs&&... args)
	{
		auto msg = wf::str_tmpf(fmt, args...);
		_log_warning_str(msg.ptr);
	}

	// logs a message with error level
	template<typename... TArgs>
	inline static void
	log_error(const char* fmt, TArgs&&... args)
	{
		auto msg = wf::str_tmpf(fmt, args...);
		_log_error_str(msg.ptr);
	}
}
