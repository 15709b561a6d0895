#pragma once

#include "wf/Exports.h"

#include <stddef.h>

namespace wf
{
	namespace memory
	{
		struct Interface;
		struct Arena;
	}

	using Allocator = memory::Interface*;

	// per thread state: the default allocator and the temporary arena
	struct Context
	{
		Allocator _allocator;
		// tmp allocator, cleared by the owner of the current unit of work (ex. after each scanned file)
		memory::Arena* _allocator_tmp;
	};

	// returns the context of the calling thread, it's created on first use and freed at thread exit
	WF_EXPORT Context*
	context_local();

	// returns the default allocator of the calling thread, which is the clib allocator
	// every container which isn't given an allocator explicitly allocates from it
	WF_EXPORT Allocator
	allocator_default();

	namespace memory
	{
		// returns the temporary arena of the calling thread
		WF_EXPORT Arena*
		tmp();
	}

	// Log Wrapper
	struct Log_Interface
	{
		void* self;
		void (*debug)(void* self, const char* msg);
		void (*warning)(void* self, const char* msg);
		void (*error)(void* self, const char* msg);
		void (*critical)(void* self, const char* msg);
	};

	// installs the given log interface and returns the previous one, null callbacks fall back to stderr
	WF_EXPORT Log_Interface
	log_interface_set(Log_Interface self);

	WF_EXPORT void
	_log_debug_str(const char* msg);

	WF_EXPORT void
	_log_warning_str(const char* msg);

	WF_EXPORT void
	_log_error_str(const char* msg);

	// reports a failed assertion, it's the only producer of critical messages
	WF_EXPORT void
	_log_critical_str(const char* msg);
}
