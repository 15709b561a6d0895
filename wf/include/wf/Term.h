#pragma once

#include "wf/Exports.h"
#include "wf/Str.h"
#include "wf/Rune.h"

namespace wf
{
	enum TERM_KIND
	{
		// a run of word runes
		TERM_KIND_WORD,
		// a run of everything else (whitespace, punctuation, invalid bytes)
		TERM_KIND_SYMBOL
	};

	// decides which runes make up a word
	enum WORD_POLICY
	{
		// alphabetic runes (letters, vowel signs), numbers, '_' and '\'', so "can't", "_foo" and "'quoted'" are
		// single words
		WORD_POLICY_ALNUM,
		// unicode word boundaries (a subset of UAX #29): letters, marks, numbers and connector punctuation
		// make up words, apostrophes and dots join letters only when they sit between two letters ("can't",
		// "e.g"), commas and dots join digits only when they sit between two digits ("3.14", "1,000")
		WORD_POLICY_UNICODE
	};

	// a classified non empty span of the scanned text, it points into the scanned text and doesn't own it
	struct Term
	{
		TERM_KIND kind;
		const char* begin;
		const char* end;
	};

	// wraps the term text in a string (does not allocate)
	inline static Str
	term_str(const Term& self)
	{
		return str_view(self.begin, self.end);
	}

	// lazy scanner which splits a text into alternating word and symbol terms
	// concatenating all the terms reproduces the text exactly, and no two neighbouring terms have the same kind
	struct Term_Scanner
	{
		const char* it;
		const char* end;
		WORD_POLICY policy;
	};

	// creates a scanner over the [begin, end) text, the text must outlive the scanner and the terms
	inline static Term_Scanner
	term_scanner_new(const char* begin, const char* end, WORD_POLICY policy = WORD_POLICY_ALNUM)
	{
		return Term_Scanner{ begin, end, policy };
	}

	// creates a scanner over the given text, the text must outlive the scanner and the terms
	inline static Term_Scanner
	term_scanner_new(const Str& text, WORD_POLICY policy = WORD_POLICY_ALNUM)
	{
		return term_scanner_new(text.ptr, text.ptr + text.count, policy);
	}

	// scans the next term, returns false when the text is exhausted
	WF_EXPORT bool
	term_scanner_next(Term_Scanner& self, Term& term);

	// returns whether the given rune starts a word under the given policy
	WF_EXPORT bool
	rune_is_word(Rune r, WORD_POLICY policy);

	// a term iterator which allows the scanner to be used in a range for loop
	struct Term_Iterator
	{
		Term_Scanner scanner;
		Term term;
		bool done;

		Term_Iterator&
		operator++()
		{
			done = term_scanner_next(scanner, term) == false;
			return *this;
		}

		bool
		operator==(const Term_Iterator& other) const
		{
			return done == other.done && (done || term.begin == other.term.begin);
		}

		bool
		operator!=(const Term_Iterator& other) const
		{
			return !operator==(other);
		}

		const Term&
		operator*() const
		{
			return term;
		}

		const Term*
		operator->() const
		{
			return &term;
		}
	};

	// terms range, which is used to make range for loops work over the terms of a text
	struct Terms
	{
		Term_Scanner scanner;

		Term_Iterator
		begin() const
		{
			Term_Iterator res{};
			res.scanner = scanner;
			++res;
			return res;
		}

		Term_Iterator
		end() const
		{
			Term_Iterator res{};
			res.done = true;
			return res;
		}
	};

	// returns a range suitable for usage in range for loops, so that you can loop over the terms of a text
	// ex. `for (auto term: wf::terms(text))`
	inline static Terms
	terms(const Str& text, WORD_POLICY policy = WORD_POLICY_ALNUM)
	{
		return Terms{ term_scanner_new(text, policy) };
	}
}
