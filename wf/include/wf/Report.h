#pragma once

#include "wf/Exports.h"
#include "wf/Counter.h"
#include "wf/Buf.h"

namespace wf
{
	enum ORDER
	{
		// ascending by count key
		ORDER_LEXICOGRAPHIC,
		// descending by count, ties broken ascending by count key
		ORDER_FREQUENCY
	};

	struct Report_Row
	{
		// the count key, which defines the order
		Word key;
		// the spelling to print
		Word word;
		size_t count;
	};

	// builds the ordered report rows out of the counting table
	WF_EXPORT Buf<Report_Row>
	report_rows(const Counter& counter, ORDER order, Allocator allocator = allocator_default());

	// returns the display width of the widest word in the given rows
	WF_EXPORT size_t
	report_width(const Buf<Report_Row>& rows);

	// renders one "{word}: {count}" line per row, the words are right aligned to the widest word
	[[nodiscard]] WF_EXPORT Str
	report_render(Str out, const Buf<Report_Row>& rows);
}
