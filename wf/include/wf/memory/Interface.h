#pragma once

#include "wf/Base.h"

#include <stdint.h>
#include <stddef.h>

namespace wf::memory
{
	// memory allocators interface, all memory allocators should implement this interface
	struct Interface
	{
		virtual ~Interface() = default;
		virtual Block alloc(size_t size, uint8_t alignment) = 0;
		virtual void free(Block block) = 0;
	};
}
