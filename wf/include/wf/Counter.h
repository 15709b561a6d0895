#pragma once

#include "wf/Exports.h"
#include "wf/Str_Intern.h"
#include "wf/Term.h"
#include "wf/Map.h"

namespace wf
{
	enum CASE_POLICY
	{
		// "Foo" and "foo" are counted together
		CASE_POLICY_INSENSITIVE,
		// "Foo" and "foo" are counted separately
		CASE_POLICY_SENSITIVE
	};

	struct Count_Entry
	{
		// the spelling shown in reports, in case insensitive mode it's the first spelling seen for the key
		Word display;
		size_t count;
	};

	// counting table of words, keyed by the interned word (case sensitive) or by the interned case folded
	// spelling of the word (case insensitive)
	struct Counter
	{
		CASE_POLICY policy;
		// the interner which owns every word in the table, not owned by the counter
		Str_Intern* intern;
		// caches the folded key of each spelling so that every distinct spelling is folded once
		Map<Word, Word> folds;
		Map<Word, Count_Entry> table;
		// count of recorded occurrences
		size_t total;
	};

	// creates a new counter that records words handed out by the given interner
	WF_EXPORT Counter
	counter_new(Str_Intern* intern, CASE_POLICY policy = CASE_POLICY_INSENSITIVE);

	WF_EXPORT void
	counter_free(Counter& self);

	inline static void
	destruct(Counter& self)
	{
		counter_free(self);
	}

	// returns the count key of the given word under the counter's case policy
	WF_EXPORT Word
	counter_key(Counter& self, Word word);

	// increments the count of the given word's key, inserting it with a count of 1 if it's new
	WF_EXPORT void
	counter_record(Counter& self, Word word);

	// scans the given utf-8 text, interns every word term and records it, symbol terms are discarded
	WF_EXPORT void
	counter_feed(Counter& self, const char* begin, const char* end, WORD_POLICY policy = WORD_POLICY_ALNUM);

	inline static void
	counter_feed(Counter& self, const Str& text, WORD_POLICY policy = WORD_POLICY_ALNUM)
	{
		counter_feed(self, text.ptr, text.ptr + text.count, policy);
	}

	// returns how many times the given spelling was counted under the counter's case policy, doesn't intern
	WF_EXPORT size_t
	counter_count(const Counter& self, const char* spelling);

	// returns the entry of the given spelling, or nullptr if it was never counted
	WF_EXPORT const Key_Value<Word, Count_Entry>*
	counter_lookup(const Counter& self, const char* spelling);

	// returns the count of distinct keys
	inline static size_t
	counter_distinct(const Counter& self)
	{
		return self.table.count;
	}

	// returns the count of recorded occurrences
	inline static size_t
	counter_total(const Counter& self)
	{
		return self.total;
	}
}
