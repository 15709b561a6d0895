#pragma once

#include "wf/Exports.h"
#include "wf/Base.h"
#include "wf/memory/Interface.h"
#include "wf/memory/CLib.h"
#include "wf/memory/Arena.h"
#include "wf/Context.h"

#include <stdint.h>
#include <utility>
#include <new>

namespace wf
{
	// allocates from the given allocator the given size of memory with the specified alignment
	inline static Block
	alloc_from(Allocator self, size_t size, uint8_t alignment)
	{
		return self->alloc(size, alignment);
	}

	// frees a block using the given allocator
	inline static void
	free_from(Allocator self, Block block)
	{
		self->free(block);
	}

	// allocates from the default allocator the given size of memory with the specified alignment
	inline static Block
	alloc(size_t size, uint8_t alignment)
	{
		return alloc_from(allocator_default(), size, alignment);
	}

	// frees a block from the default allocator
	inline static void
	free(Block block)
	{
		free_from(allocator_default(), block);
	}

	// allocates a single instance of the given type and calls its constructor with the given arguments
	template<typename T, typename ... TArgs>
	inline static T*
	alloc_construct_from(Allocator self, TArgs&& ... args)
	{
		T* res = (T*)alloc_from(self, sizeof(T), alignof(T)).ptr;
		::new (res) T(std::forward<TArgs>(args)...);
		return res;
	}

	// destructs and frees the given instance from the allocator
	template<typename T>
	inline static void
	free_destruct_from(Allocator self, T* ptr)
	{
		ptr->~T();
		free_from(self, Block{ (void*)ptr, sizeof(T) });
	}

	// allocates a single instance of the given type from the default allocator and calls its constructor
	template<typename T, typename ... TArgs>
	inline static T*
	alloc_construct(TArgs&& ... args)
	{
		return alloc_construct_from<T>(allocator_default(), std::forward<TArgs>(args)...);
	}

	// destructs and frees the given instance from the default allocator
	template<typename T>
	inline static void
	free_destruct(T* ptr)
	{
		free_destruct_from(allocator_default(), ptr);
	}

	// creates a new arena allocator with the given block size and meta allocator
	// read more about arena allocator in Arena.h
	inline static memory::Arena*
	allocator_arena_new(size_t block_size = 4096, Allocator meta = memory::clib())
	{
		return alloc_construct_from<memory::Arena>(meta, block_size, meta);
	}

	// frees the given arena and all the memory it handed out
	inline static void
	allocator_arena_free(memory::Arena* self)
	{
		auto meta = self->meta;
		free_destruct_from(meta, self);
	}
}
