#pragma once

#include "wf/Exports.h"
#include "wf/Fmt.h"

namespace wf
{
	[[noreturn]] WF_EXPORT void
	_panic(const char* cause);

	// prints the given message then terminates the program
	template<typename ... TArgs>
	[[noreturn]] inline static void
	panic(const char* fmt, TArgs&& ... args)
	{
		_panic(str_tmpf(fmt, args...).ptr);
	}
}
