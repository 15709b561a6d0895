#pragma once

#include "wf/Exports.h"
#include "wf/Assert.h"

#include <stddef.h>
#include <stdint.h>

namespace wf
{
	// represents a block of memory
	struct Block
	{
		// pointer to the memory block
		void* ptr;

		// size of the memory block in bytes
		size_t size;
	};

	// returns whether the given memory block is empty (points to null or size is 0 bytes)
	inline static bool
	block_is_empty(Block self)
	{
		return self.ptr == nullptr || self.size == 0;
	}

	// wraps the bytes in the [begin, end) range in a memory block
	inline static Block
	block_from_range(const char* begin, const char* end)
	{
		wf_assert(end >= begin);
		return Block{ (void*)begin, size_t(end - begin) };
	}
}
