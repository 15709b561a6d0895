#include "wf/Str.h"

#include <utf8proc.h>

#include <stdlib.h>

namespace wf
{
	// API
	Str
	str_new()
	{
		return buf_new<char>();
	}

	Str
	str_with_allocator(Allocator allocator)
	{
		return buf_with_allocator<char>(allocator);
	}

	Str
	str_from_c(const char* str, Allocator allocator)
	{
		if (str == nullptr)
			return str_with_allocator(allocator);
		return str_from_substr(str, str + ::strlen(str), allocator);
	}

	Str
	str_from_substr(const char* begin, const char* end, Allocator allocator)
	{
		wf_assert_msg(end >= begin, "Invalid substring");

		Str self = str_with_allocator(allocator);

		//this is an empty string
		if(end == begin)
			return self;

		buf_resize(self, (end - begin) + 1);
		--self.count;
		::memcpy(self.ptr, begin, self.count);
		self.ptr[self.count] = '\0';
		return self;
	}

	Str
	str_lit(const char* lit)
	{
		Str self{};
		self.ptr = (char*)lit;
		if(lit)
		{
			self.count = ::strlen(lit);
			self.cap = self.count + 1;
		}
		return self;
	}

	void
	str_free(Str& self)
	{
		buf_free(self);
	}

	void
	str_block_push(Str& self, Block block)
	{
		size_t self_len = self.count;
		buf_resize(self, self.count + block.size + 1);
		--self.count;
		if (block.size)
			::memcpy(self.ptr + self_len, block.ptr, block.size);
		self.ptr[self.count] = '\0';
	}

	void
	str_pushn(Str& self, size_t n, char c)
	{
		size_t self_len = self.count;
		buf_resize(self, self.count + n + 1);
		--self.count;
		::memset(self.ptr + self_len, c, n);
		self.ptr[self.count] = '\0';
	}

	void
	str_null_terminate(Str& self)
	{
		buf_reserve(self, 1);
		self.ptr[self.count] = '\0';
	}

	void
	str_reserve(Str& self, size_t size)
	{
		// +1 for the null terminator
		buf_reserve(self, size + 1);
	}

	void
	str_clear(Str& self)
	{
		buf_clear(self);
		if (self.cap)
			self.ptr[0] = '\0';
	}

	Str
	str_clone(const Str& other, Allocator allocator)
	{
		return str_from_substr(other.ptr, other.ptr + other.count, allocator);
	}

	Str
	str_fold(const char* begin, const char* end, Allocator allocator)
	{
		utf8proc_uint8_t* folded = nullptr;
		auto size = utf8proc_map(
			(const utf8proc_uint8_t*)begin,
			utf8proc_ssize_t(end - begin),
			&folded,
			utf8proc_option_t(UTF8PROC_CASEFOLD)
		);
		if (size < 0)
			return str_from_substr(begin, end, allocator);

		auto self = str_from_substr((const char*)folded, (const char*)folded + size, allocator);
		// utf8proc allocates the result with malloc
		::free(folded);
		return self;
	}

	size_t
	str_width(const char* begin, const char* end)
	{
		size_t width = 0;
		const char* it = begin;
		while (it < end)
		{
			Rune r = 0;
			int size = rune_decode(it, end, &r);
			if (size < 0)
			{
				// invalid bytes are printed as a single replacement character
				++width;
				++it;
				continue;
			}
			int w = rune_width(r);
			width += w > 0 ? size_t(w) : 0;
			it += size;
		}
		return width;
	}
}
