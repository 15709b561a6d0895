#pragma once

#include <fmt/format.h>

#include <iterator>
#include <string_view>

#include "wf/Str.h"
#include "wf/File.h"

namespace fmt
{
	template<>
	struct formatter<wf::Str>
	{
		template<typename ParseContext>
		constexpr auto
		parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto
		format(const wf::Str& str, FormatContext& ctx) const
		{
			if (str.count == 0)
				return ctx.out();
			return format_to(ctx.out(), "{}", std::string_view{str.ptr, str.count});
		}
	};
}

namespace wf
{
	// appends the formatted string to the end of the given out string, you should assign the returned value back
	// into the given string
	template<typename ... Args>
	[[nodiscard]] inline static Str
	strf(Str out, const char* format_str, const Args& ... args)
	{
		fmt::memory_buffer buf;
		fmt::vformat_to(std::back_inserter(buf), fmt::string_view(format_str), fmt::make_format_args(args...));
		str_block_push(out, Block{buf.data(), buf.size()});
		return out;
	}

	// creates a new string using the default allocator containing the formatted string
	template<typename ... Args>
	[[nodiscard]] inline static Str
	strf(const char* format_str, const Args& ... args)
	{
		return strf(str_new(), format_str, args...);
	}

	// creates a new temporary string using the tmp allocator containing the formatted string
	template<typename ... Args>
	inline static Str
	str_tmpf(const char* format_str, const Args& ... args)
	{
		return strf(str_tmp(), format_str, args...);
	}

	// prints the formatted string to the given file
	template<typename ... Args>
	inline static int64_t
	print_to(File file, const char* format_str, const Args& ... args)
	{
		fmt::memory_buffer buf;
		fmt::vformat_to(std::back_inserter(buf), fmt::string_view(format_str), fmt::make_format_args(args...));
		return file_write(file, Block{buf.data(), buf.size()});
	}

	// prints the formatted string to the standard output stream
	template<typename ... Args>
	inline static int64_t
	print(const char* format_str, const Args& ... args)
	{
		return print_to(file_stdout(), format_str, args...);
	}

	// prints the formatted string to the standard error stream
	template<typename ... Args>
	inline static int64_t
	printerr(const char* format_str, const Args& ... args)
	{
		return print_to(file_stderr(), format_str, args...);
	}
}
