#pragma once

#include "wf/Exports.h"
#include "wf/memory/Interface.h"
#include "wf/Base.h"

#include <stdint.h>
#include <stddef.h>

namespace wf::memory
{
	// a wrapper around system's libc allocator
	struct CLib : Interface
	{
		// uses malloc to allocate the given block, panics if the system is out of memory
		WF_EXPORT Block
		alloc(size_t size, uint8_t alignment) override;

		WF_EXPORT void
		free(Block block) override;
	};

	// returns the global instance of the libc allocator
	WF_EXPORT CLib*
	clib();
}
