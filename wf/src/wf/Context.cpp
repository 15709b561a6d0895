#include "wf/Context.h"
#include "wf/Memory.h"
#include "wf/Fmt.h"

namespace wf
{
	static Log_Interface LOG;

	// owns the thread's tmp arena, the default allocator is a process wide singleton
	struct Thread_Context
	{
		Context self;

		Thread_Context()
		{
			self._allocator = memory::clib();
			self._allocator_tmp = alloc_construct_from<memory::Arena>(memory::clib(), 4ULL * 1024ULL * 1024ULL, memory::clib());
		}

		~Thread_Context()
		{
			free_destruct_from(memory::clib(), self._allocator_tmp);
		}
	};

	inline static void
	_log_or_print(void (*callback)(void*, const char*), const char* level, const char* msg)
	{
		if (callback)
			callback(LOG.self, msg);
		else
			printerr("[{}]: {}\n", level, msg);
	}

	// API
	Context*
	context_local()
	{
		thread_local Thread_Context _CONTEXT;
		return &_CONTEXT.self;
	}

	Allocator
	allocator_default()
	{
		return context_local()->_allocator;
	}

	namespace memory
	{
		Arena*
		tmp()
		{
			return context_local()->_allocator_tmp;
		}
	}

	Log_Interface
	log_interface_set(Log_Interface self)
	{
		auto res = LOG;
		LOG = self;
		return res;
	}

	void
	_log_debug_str(const char* msg)
	{
		_log_or_print(LOG.debug, "debug", msg);
	}

	void
	_log_warning_str(const char* msg)
	{
		_log_or_print(LOG.warning, "warning", msg);
	}

	void
	_log_error_str(const char* msg)
	{
		_log_or_print(LOG.error, "error", msg);
	}

	void
	_log_critical_str(const char* msg)
	{
		_log_or_print(LOG.critical, "critical", msg);
	}
}
