#pragma once

#include "wf/Exports.h"
#include "wf/Str.h"
#include "wf/Map.h"
#include "wf/Memory.h"
#include "wf/Fmt.h"

#include <string_view>

namespace wf
{
	// a canonical interned word, words handed out by the same interner are equal if and only if
	// their pointers are equal, the bytes are null terminated and live as long as the interner
	struct Word
	{
		const char* ptr;
		size_t count;
	};

	inline static bool
	operator==(Word a, Word b)
	{
		return a.ptr == b.ptr;
	}

	inline static bool
	operator!=(Word a, Word b)
	{
		return a.ptr != b.ptr;
	}

	// compares the spelling of the two words byte by byte
	inline static int
	word_cmp(Word a, Word b)
	{
		if (a.ptr == b.ptr)
			return 0;
		return str_cmp(a.ptr, a.count, b.ptr, b.count);
	}

	// wraps the word spelling in a string (does not allocate)
	inline static Str
	word_str(Word self)
	{
		return str_view(self.ptr, self.ptr + self.count);
	}

	template<>
	struct Hash<Word>
	{
		inline size_t
		operator()(Word w) const
		{
			return Hash<const char*>()(w.ptr);
		}
	};

	// string interning structure
	// all of the unique spellings are copied once into the interner's arena and every time a duplicate is
	// encountered it returns the same stored word, so words can be compared and hashed by pointer
	struct Str_Intern
	{
		// owns the bytes of every interned word, it's only released in str_intern_free
		memory::Arena* arena;
		// maps spelling bytes to the arena copy
		Set<Str> strings;
	};

	// creates a new string interner, the word bytes are allocated in blocks of the given size
	inline static Str_Intern
	str_intern_new(size_t block_size = 64ULL * 1024ULL)
	{
		return Str_Intern {
			allocator_arena_new(block_size),
			set_new<Str>()
		};
	}

	// frees the given string interner, all the words it handed out become invalid
	inline static void
	str_intern_free(Str_Intern& self)
	{
		// the strings point into the arena, so the set only frees its own tables
		set_free(self.strings);
		allocator_arena_free(self.arena);
		self.arena = nullptr;
	}

	// destruct overload for string intern free
	inline static void
	destruct(Str_Intern& self)
	{
		str_intern_free(self);
	}

	// interns the given [begin, end) spelling and returns the canonical word, copies the bytes only the first
	// time a spelling is seen
	WF_EXPORT Word
	str_intern(Str_Intern& self, const char* begin, const char* end);

	// interns the given string and returns the canonical word
	inline static Word
	str_intern(Str_Intern& self, const Str& str)
	{
		return str_intern(self, str.ptr, str.ptr + str.count);
	}

	// interns the given c string and returns the canonical word
	inline static Word
	str_intern(Str_Intern& self, const char* str)
	{
		return str_intern(self, str, str + ::strlen(str));
	}

	// returns the canonical word of the given spelling without interning it, or a word with a null ptr
	// if the spelling was never interned
	WF_EXPORT Word
	str_intern_find(const Str_Intern& self, const char* begin, const char* end);

	// returns the count of distinct interned spellings
	inline static size_t
	str_intern_count(const Str_Intern& self)
	{
		return self.strings.count;
	}
}

namespace fmt
{
	template<>
	struct formatter<wf::Word>
	{
		template<typename ParseContext>
		constexpr auto
		parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto
		format(const wf::Word& word, FormatContext& ctx) const
		{
			return format_to(ctx.out(), "{}", std::string_view{word.ptr, word.count});
		}
	};
}
