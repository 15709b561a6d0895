#pragma once

#include "wf/Exports.h"
#include "wf/memory/Interface.h"
#include "wf/memory/CLib.h"
#include "wf/Base.h"

#include <stdint.h>
#include <stddef.h>

namespace wf::memory
{
	// arena is a bulk allocator, it requests big blocks (node_size bytes or bigger) from the meta allocator and
	// subdivides them on demand. individual frees are ignored, memory goes back to the meta allocator only in
	// free_all or when the arena is destroyed. interned words live in an arena for the entire run
	struct Arena : Interface
	{
		struct Node
		{
			Block mem;
			uint8_t* alloc_head;
			Node* next;
		};

		Interface* meta;
		Node* head;
		// granularity of the requests made to the meta allocator
		size_t block_size;
		// total amount of memory requested from the meta allocator in bytes
		size_t total_mem;
		// actual used memory in bytes
		size_t used_mem;
		// peak memory usage in bytes
		size_t highwater_mem;

		WF_EXPORT
		Arena(size_t block_size, Interface* meta = clib());

		WF_EXPORT
		~Arena() override;

		WF_EXPORT Block
		alloc(size_t size, uint8_t alignment) override;

		// does nothing, arena doesn't support individual frees
		WF_EXPORT void
		free(Block block) override;

		// ensures the head node has room for size bytes with the given alignment
		WF_EXPORT void
		grow(size_t size, uint8_t alignment);

		// frees the entire arena to the meta allocator
		WF_EXPORT void
		free_all();

		// resets the allocation state but keeps one node around for reuse, nodes beyond the first are released
		// and the kept node is sized to the highwater mark
		WF_EXPORT void
		clear_all();
	};
}
