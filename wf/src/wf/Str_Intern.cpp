#include "wf/Str_Intern.h"

namespace wf
{
	Word
	str_intern(Str_Intern& self, const char* begin, const char* end)
	{
		wf_assert_msg(end >= begin, "Invalid substring");

		if (auto it = set_lookup(self.strings, str_view(begin, end)))
			return Word{ it->ptr, it->count };

		size_t count = size_t(end - begin);
		auto ptr = (char*)alloc_from(self.arena, count + 1, alignof(char)).ptr;
		if (count)
			::memcpy(ptr, begin, count);
		ptr[count] = '\0';

		Str stored{};
		stored.allocator = self.arena;
		stored.ptr = ptr;
		stored.count = count;
		stored.cap = count + 1;
		set_insert(self.strings, stored);

		return Word{ ptr, count };
	}

	Word
	str_intern_find(const Str_Intern& self, const char* begin, const char* end)
	{
		if (auto it = set_lookup(self.strings, str_view(begin, end)))
			return Word{ it->ptr, it->count };
		return Word{};
	}
}
