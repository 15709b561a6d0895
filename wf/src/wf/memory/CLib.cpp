#include "wf/memory/CLib.h"
#include "wf/OS.h"

#include <stdlib.h>

namespace wf::memory
{
	Block
	CLib::alloc(size_t size, uint8_t)
	{
		Block res{};
		res.ptr = ::malloc(size);
		if (res.ptr == nullptr && size > 0)
			panic("system out of memory");
		res.size = size;
		return res;
	}

	void
	CLib::free(Block block)
	{
		::free(block.ptr);
	}

	CLib*
	clib()
	{
		static CLib _clib_allocator;
		return &_clib_allocator;
	}
}
