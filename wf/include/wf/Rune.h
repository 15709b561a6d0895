#pragma once

#include "wf/Exports.h"
#include "wf/Base.h"

#include <stdint.h>
#include <stddef.h>

namespace wf
{
	// a rune, which is a unicode code point
	typedef int32_t Rune;

	// decodes a single utf-8 encoded rune from the [it, end) range into r
	// returns the size of the encoded rune in bytes, or -1 if the bytes are not valid utf-8
	WF_EXPORT int
	rune_decode(const char* it, const char* end, Rune* r);

	// returns whether the [begin, end) range is entirely valid utf-8
	WF_EXPORT bool
	rune_valid_utf8(const char* begin, const char* end);

	// return whether the given rune is a letter (general category L*)
	WF_EXPORT bool
	rune_is_letter(Rune c);

	// return whether the given rune has the unicode Alphabetic property: letters, letter numbers (Nl) and
	// Other_Alphabetic runes like the devanagari vowel sign i (U+093F) or circled letters (U+24B6)
	WF_EXPORT bool
	rune_is_alphabetic(Rune c);

	// return whether the given rune is a number (general category N*)
	WF_EXPORT bool
	rune_is_number(Rune c);

	// return whether the given rune is a combining mark (general category M*)
	WF_EXPORT bool
	rune_is_mark(Rune c);

	// return whether the given rune is a connector punctuation (general category Pc, ex. '_')
	WF_EXPORT bool
	rune_is_connector(Rune c);

	// returns the number of terminal columns the given rune occupies
	WF_EXPORT int
	rune_width(Rune c);
}
