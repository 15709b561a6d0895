#include "wf/Report.h"
#include "wf/Fmt.h"

#include <algorithm>

namespace wf
{
	Buf<Report_Row>
	report_rows(const Counter& counter, ORDER order, Allocator allocator)
	{
		auto rows = buf_with_allocator<Report_Row>(allocator);
		buf_reserve(rows, counter.table.count);
		for (const auto& [key, entry]: counter.table)
			buf_push(rows, Report_Row{ key, entry.display, entry.count });

		switch (order)
		{
		case ORDER_LEXICOGRAPHIC:
			std::sort(begin(rows), end(rows), [](const Report_Row& a, const Report_Row& b) {
				return word_cmp(a.key, b.key) < 0;
			});
			break;
		case ORDER_FREQUENCY:
			// count alone isn't unique, the key makes it a total order
			std::sort(begin(rows), end(rows), [](const Report_Row& a, const Report_Row& b) {
				if (a.count != b.count)
					return a.count > b.count;
				return word_cmp(a.key, b.key) < 0;
			});
			break;
		default:
			wf_unreachable();
			break;
		}
		return rows;
	}

	size_t
	report_width(const Buf<Report_Row>& rows)
	{
		size_t width = 0;
		for (const auto& row: rows)
		{
			auto w = str_width(row.word.ptr, row.word.ptr + row.word.count);
			if (w > width)
				width = w;
		}
		return width;
	}

	Str
	report_render(Str out, const Buf<Report_Row>& rows)
	{
		auto width = report_width(rows);
		for (const auto& row: rows)
		{
			auto w = str_width(row.word.ptr, row.word.ptr + row.word.count);
			str_pushn(out, width - w, ' ');
			out = strf(out, "{}: {}\n", row.word, row.count);
		}
		return out;
	}
}
