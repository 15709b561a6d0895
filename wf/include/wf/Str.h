#pragma once

#include "wf/Exports.h"
#include "wf/Rune.h"
#include "wf/Buf.h"
#include "wf/Map.h"
#include "wf/Assert.h"

#include <string.h>

namespace wf
{
	// a string is just a `Buf<char>` so it's suitable to use the buf functions with the string
	// but use with caution since the null terminator should be maintained all the time
	using Str = Buf<char>;

	// creates a new string
	WF_EXPORT Str
	str_new();

	// creates a new string with the given allocator
	WF_EXPORT Str
	str_with_allocator(Allocator allocator);

	// creates a new string from the given c string
	WF_EXPORT Str
	str_from_c(const char* str, Allocator allocator = allocator_default());

	// creates a new string from the given sub string
	WF_EXPORT Str
	str_from_substr(const char* begin, const char* end, Allocator allocator = allocator_default());

	// wraps a string literal into a string (does not allocate)
	WF_EXPORT Str
	str_lit(const char* lit);

	// wraps the [begin, end) range into a string (does not allocate, and is not null terminated)
	inline static Str
	str_view(const char* begin, const char* end)
	{
		wf_assert(end >= begin);
		Str self{};
		self.ptr = (char*)begin;
		self.count = size_t(end - begin);
		return self;
	}

	// creates a new temporary string
	inline static Str
	str_tmp(const char* str = nullptr)
	{
		return str_from_c(str, memory::tmp());
	}

	// frees the given string
	WF_EXPORT void
	str_free(Str& self);

	// destruct overload for str free
	inline static void
	destruct(Str& self)
	{
		str_free(self);
	}

	// pushes the given block of bytes into the string
	WF_EXPORT void
	str_block_push(Str& self, Block block);

	// pushes the second string into the first one
	inline static void
	str_push(Str& self, const char* str)
	{
		if (str == nullptr)
			return;
		str_block_push(self, Block{ (void*)str, ::strlen(str) });
	}

	// pushes the second string into the first one
	inline static void
	str_push(Str& self, const Str& str)
	{
		str_block_push(self, Block{ str.ptr, str.count });
	}

	// pushes the given char n times into the string
	WF_EXPORT void
	str_pushn(Str& self, size_t n, char c);

	// ensures that string is null terminated
	WF_EXPORT void
	str_null_terminate(Str& self);

	// ensures the given string has the capacity to hold the specified size
	WF_EXPORT void
	str_reserve(Str& self, size_t size);

	// clears the string, keeps the memory around for reuse
	WF_EXPORT void
	str_clear(Str& self);

	// clones the string using the given allocator
	WF_EXPORT Str
	str_clone(const Str& other, Allocator allocator = allocator_default());

	// returns a new string with the full unicode case folding of the given utf-8 range (ex. "Straße" -> "strasse")
	// invalid utf-8 is copied as is
	WF_EXPORT Str
	str_fold(const char* begin, const char* end, Allocator allocator = allocator_default());

	// returns the number of terminal columns the given utf-8 range occupies
	WF_EXPORT size_t
	str_width(const char* begin, const char* end);

	// returns the number of terminal columns the given string occupies
	inline static size_t
	str_width(const Str& self)
	{
		return str_width(self.ptr, self.ptr + self.count);
	}

	template<>
	struct Hash<Str>
	{
		inline size_t
		operator()(const Str& str) const
		{
			return murmur_hash(str.ptr, str.count);
		}
	};

	// compares the bytes of the two ranges as unsigned chars, shorter prefix comes first
	// returns 0 if they are equal, a positive value if a > b, and a negative value if a < b
	inline static int
	str_cmp(const char* a, size_t a_count, const char* b, size_t b_count)
	{
		size_t n = a_count < b_count ? a_count : b_count;
		if (n > 0)
		{
			if (int res = ::memcmp(a, b, n))
				return res;
		}
		if (a_count == b_count)
			return 0;
		return a_count < b_count ? -1 : 1;
	}

	inline static int
	str_cmp(const Str& a, const Str& b)
	{
		return str_cmp(a.ptr, a.count, b.ptr, b.count);
	}

	inline static bool
	operator==(const Str& a, const Str& b)
	{
		return a.count == b.count && str_cmp(a, b) == 0;
	}

	inline static bool
	operator!=(const Str& a, const Str& b)
	{
		return !(a == b);
	}

	inline static bool
	operator<(const Str& a, const Str& b)
	{
		return str_cmp(a, b) < 0;
	}

	inline static bool
	operator>(const Str& a, const Str& b)
	{
		return str_cmp(a, b) > 0;
	}

	inline static bool
	operator==(const Str& a, const char* b)
	{
		return a == str_lit(b);
	}

	inline static bool
	operator!=(const Str& a, const char* b)
	{
		return !(a == str_lit(b));
	}
}
