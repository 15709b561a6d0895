#include "wf/Term.h"

namespace wf
{
	enum RUNE_CLASS
	{
		RUNE_CLASS_LETTER,
		RUNE_CLASS_NUMBER,
		RUNE_CLASS_OTHER
	};

	inline static bool
	_rune_is_alnum_word(Rune r)
	{
		return r == '_' || r == '\'' || rune_is_alphabetic(r) || rune_is_number(r);
	}

	inline static bool
	_rune_is_unicode_word(Rune r)
	{
		return rune_is_letter(r) || rune_is_number(r) || rune_is_mark(r) || rune_is_connector(r);
	}

	// MidLetter, MidNumLet and Single_Quote word break properties
	inline static bool
	_rune_joins_letters(Rune r)
	{
		switch (r)
		{
		case 0x0027: case 0x002E: case 0x003A: case 0x00B7: case 0x0387: case 0x055F:
		case 0x05F4: case 0x2018: case 0x2019: case 0x2024: case 0x2027: case 0xFE13:
		case 0xFE52: case 0xFE55: case 0xFF07: case 0xFF0E: case 0xFF1A:
			return true;
		default:
			return false;
		}
	}

	// MidNum, MidNumLet and Single_Quote word break properties
	inline static bool
	_rune_joins_numbers(Rune r)
	{
		switch (r)
		{
		case 0x0027: case 0x002C: case 0x002E: case 0x003B: case 0x037E: case 0x0589:
		case 0x060C: case 0x060D: case 0x066C: case 0x07F8: case 0x2018: case 0x2019:
		case 0x2024: case 0x2044: case 0xFE10: case 0xFE14: case 0xFE50: case 0xFE52:
		case 0xFE54: case 0xFF07: case 0xFF0C: case 0xFF0E: case 0xFF1B:
			return true;
		default:
			return false;
		}
	}

	inline static const char*
	_scan_symbol(const char* it, const char* end, WORD_POLICY policy)
	{
		while (it < end)
		{
			Rune r = 0;
			int size = rune_decode(it, end, &r);
			// malformed bytes are symbols, one byte at a time
			if (size < 0)
			{
				++it;
				continue;
			}
			if (rune_is_word(r, policy))
				break;
			it += size;
		}
		return it;
	}

	inline static const char*
	_scan_alnum_word(const char* it, const char* end)
	{
		while (it < end)
		{
			Rune r = 0;
			int size = rune_decode(it, end, &r);
			if (size < 0 || _rune_is_alnum_word(r) == false)
				break;
			it += size;
		}
		return it;
	}

	inline static const char*
	_scan_unicode_word(const char* it, const char* end)
	{
		auto prev = RUNE_CLASS_OTHER;
		while (it < end)
		{
			Rune r = 0;
			int size = rune_decode(it, end, &r);
			if (size < 0)
				break;

			if (_rune_is_unicode_word(r))
			{
				if (rune_is_letter(r))
					prev = RUNE_CLASS_LETTER;
				else if (rune_is_number(r))
					prev = RUNE_CLASS_NUMBER;
				else if (rune_is_connector(r))
					prev = RUNE_CLASS_OTHER;
				// marks extend the rune before them and keep its class
				it += size;
				continue;
			}

			// a joiner continues the word only if it sits between two letters or two numbers
			bool joins_letters = prev == RUNE_CLASS_LETTER && _rune_joins_letters(r);
			bool joins_numbers = prev == RUNE_CLASS_NUMBER && _rune_joins_numbers(r);
			if (joins_letters == false && joins_numbers == false)
				break;

			Rune next = 0;
			if (rune_decode(it + size, end, &next) < 0)
				break;
			if (joins_letters && rune_is_letter(next) == false)
				break;
			if (joins_numbers && rune_is_number(next) == false)
				break;
			it += size;
		}
		return it;
	}

	// API
	bool
	rune_is_word(Rune r, WORD_POLICY policy)
	{
		switch (policy)
		{
		case WORD_POLICY_ALNUM: return _rune_is_alnum_word(r);
		case WORD_POLICY_UNICODE: return _rune_is_unicode_word(r);
		default: wf_unreachable(); return false;
		}
	}

	bool
	term_scanner_next(Term_Scanner& self, Term& term)
	{
		if (self.it >= self.end)
			return false;

		Rune r = 0;
		int size = rune_decode(self.it, self.end, &r);

		term.begin = self.it;
		if (size > 0 && rune_is_word(r, self.policy))
		{
			term.kind = TERM_KIND_WORD;
			if (self.policy == WORD_POLICY_UNICODE)
				self.it = _scan_unicode_word(self.it, self.end);
			else
				self.it = _scan_alnum_word(self.it, self.end);
		}
		else
		{
			term.kind = TERM_KIND_SYMBOL;
			self.it = _scan_symbol(self.it, self.end, self.policy);
		}
		term.end = self.it;

		wf_assert(term.end > term.begin);
		return true;
	}
}
