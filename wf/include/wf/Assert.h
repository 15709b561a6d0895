#pragma once

#include "wf/Exports.h"

#if WF_COMPILER_MSVC
	#define wf_debug_break() __debugbreak()
#elif WF_COMPILER_CLANG || WF_COMPILER_GNU
	#define wf_debug_break() __builtin_trap()
#else
	#error unknown compiler
#endif

namespace wf
{
	WF_EXPORT void
	_report_assert_message(const char* expr, const char* message, const char* file, int line);
}

#ifdef NDEBUG
	#define wf_assert_msg(expr, message) ((void)0)
	#define wf_assert(expr) ((void)0)
#else
	#define wf_assert_msg(expr, message) do { if (expr) {} else { wf::_report_assert_message(#expr, message, __FILE__, __LINE__); wf_debug_break(); } } while(false)
	#define wf_assert(expr) do { if (expr) {} else { wf::_report_assert_message(#expr, nullptr, __FILE__, __LINE__); wf_debug_break(); } } while(false)
#endif

#define wf_unreachable() wf_assert_msg(false, "unreachable")
