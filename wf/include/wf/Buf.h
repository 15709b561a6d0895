#pragma once

#include "wf/Base.h"
#include "wf/Memory.h"
#include "wf/Assert.h"

#include <string.h>

namespace wf
{
	// dynamic array of trivially copyable values, it's the storage behind strings, hash tables and report rows
	template<typename T>
	struct Buf
	{
		// the allocator which this buf instance uses
		Allocator allocator;
		// pointer to the memory allocated by this buf
		T* ptr;
		// count of elements that exist in this buf
		size_t count;
		// capacity of elements which the allocated memory can hold
		size_t cap;

		T&
		operator[](size_t ix)
		{
			wf_assert(ix < count);
			return ptr[ix];
		}

		const T&
		operator[](size_t ix) const
		{
			wf_assert(ix < count);
			return ptr[ix];
		}
	};

	// creates a new buf using the default allocator
	template<typename T>
	inline static Buf<T>
	buf_new()
	{
		Buf<T> self{};
		self.allocator = allocator_default();
		return self;
	}

	// creates a buf instance with a custom allocator
	template<typename T>
	inline static Buf<T>
	buf_with_allocator(Allocator allocator)
	{
		Buf<T> self{};
		self.allocator = allocator;
		return self;
	}

	// frees the given buf instance, if it's empty it does nothing
	template<typename T>
	inline static void
	buf_free(Buf<T>& self)
	{
		if(self.cap && self.allocator)
			free_from(self.allocator, Block{ self.ptr, self.cap * sizeof(T) });
		self.cap = 0;
		self.count = 0;
		self.ptr = nullptr;
	}

	// a general destruct function overload which calls the destructor of the given value
	template<typename T>
	inline static void
	destruct(T& value)
	{
		value.~T();
	}

	// destructs every element then frees the buf itself, use it for bufs of owning values (ex. Buf<Str>)
	template<typename T>
	inline static void
	destruct(Buf<T>& self)
	{
		for(size_t i = 0; i < self.count; ++i)
			destruct(self[i]);
		buf_free(self);
	}

	// clears the given buf, by changing the element count to 0, it doesn't free the memory
	template<typename T>
	inline static void
	buf_clear(Buf<T>& self)
	{
		self.count = 0;
	}

	template<typename T>
	inline static void
	_buf_reserve_exact(Buf<T>& self, size_t new_cap)
	{
		if (self.allocator == nullptr)
			self.allocator = allocator_default();

		Block new_block = alloc_from(self.allocator, new_cap * sizeof(T), alignof(T));
		if(self.count)
			::memcpy(new_block.ptr, self.ptr, self.count * sizeof(T));
		if(self.cap)
			free_from(self.allocator, Block{ self.ptr, self.cap * sizeof(T) });
		self.ptr = (T*)new_block.ptr;
		self.cap = new_cap;
	}

	// ensures the given buf has the capacity to hold the added size
	template<typename T>
	inline static void
	buf_reserve(Buf<T>& self, size_t added_size)
	{
		if(self.count + added_size <= self.cap)
			return;

		size_t next_cap = self.cap + self.cap / 2;
		size_t accurate_cap = self.count + added_size;
		_buf_reserve_exact(self, next_cap > accurate_cap ? next_cap : accurate_cap);
	}

	// resizes the given buf to the new count of elements, new elements are not initialized
	template<typename T>
	inline static void
	buf_resize(Buf<T>& self, size_t new_size)
	{
		if(new_size > self.count)
			buf_reserve(self, new_size - self.count);
		self.count = new_size;
	}

	// pushes a new value to the end of the given buf
	template<typename T, typename R>
	inline static T*
	buf_push(Buf<T>& self, const R& value)
	{
		if(self.count == self.cap)
			buf_reserve(self, self.cap ? self.cap : 8);

		self.ptr[self.count] = T(value);
		++self.count;
		return self.ptr + self.count - 1;
	}

	// begin/end overloads which make range for loops and standard algorithms work
	// ex. `for (auto x: buf)` and `std::sort(begin(buf), end(buf))`
	template<typename T>
	inline static const T*
	begin(const Buf<T>& self)
	{
		return self.ptr;
	}

	template<typename T>
	inline static T*
	begin(Buf<T>& self)
	{
		return self.ptr;
	}

	template<typename T>
	inline static const T*
	end(const Buf<T>& self)
	{
		return self.ptr + self.count;
	}

	template<typename T>
	inline static T*
	end(Buf<T>& self)
	{
		return self.ptr + self.count;
	}
}
