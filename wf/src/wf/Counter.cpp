#include "wf/Counter.h"

namespace wf
{
	// lower case ascii spellings are their own case folding
	inline static bool
	_word_is_folded_ascii(Word word)
	{
		for (size_t i = 0; i < word.count; ++i)
		{
			auto c = (unsigned char)word.ptr[i];
			if (c >= 0x80 || (c >= 'A' && c <= 'Z'))
				return false;
		}
		return true;
	}

	// API
	Counter
	counter_new(Str_Intern* intern, CASE_POLICY policy)
	{
		Counter self{};
		self.policy = policy;
		self.intern = intern;
		self.folds = map_new<Word, Word>();
		self.table = map_new<Word, Count_Entry>();
		self.total = 0;
		return self;
	}

	void
	counter_free(Counter& self)
	{
		map_free(self.folds);
		map_free(self.table);
		self.total = 0;
	}

	Word
	counter_key(Counter& self, Word word)
	{
		if (self.policy == CASE_POLICY_SENSITIVE || _word_is_folded_ascii(word))
			return word;

		if (auto it = map_lookup(self.folds, word))
			return it->value;

		auto folded = str_fold(word.ptr, word.ptr + word.count, memory::tmp());
		auto key = str_intern(*self.intern, folded);
		map_insert(self.folds, word, key);
		return key;
	}

	void
	counter_record(Counter& self, Word word)
	{
		auto key = counter_key(self, word);
		if (auto it = map_lookup(self.table, key))
			++it->value.count;
		else
			map_insert(self.table, key, Count_Entry{ word, 1 });
		++self.total;
	}

	void
	counter_feed(Counter& self, const char* begin, const char* end, WORD_POLICY policy)
	{
		auto scanner = term_scanner_new(begin, end, policy);
		Term term{};
		while (term_scanner_next(scanner, term))
		{
			if (term.kind != TERM_KIND_WORD)
				continue;
			counter_record(self, str_intern(*self.intern, term.begin, term.end));
		}
	}

	const Key_Value<Word, Count_Entry>*
	counter_lookup(const Counter& self, const char* spelling)
	{
		auto spelling_end = spelling + ::strlen(spelling);

		Word key{};
		if (self.policy == CASE_POLICY_SENSITIVE)
		{
			key = str_intern_find(*self.intern, spelling, spelling_end);
		}
		else
		{
			auto folded = str_fold(spelling, spelling_end, memory::tmp());
			key = str_intern_find(*self.intern, folded.ptr, folded.ptr + folded.count);
		}

		if (key.ptr == nullptr)
			return nullptr;
		return map_lookup(self.table, key);
	}

	size_t
	counter_count(const Counter& self, const char* spelling)
	{
		if (auto it = counter_lookup(self, spelling))
			return it->value.count;
		return 0;
	}
}
