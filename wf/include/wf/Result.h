#pragma once

#include "wf/Str.h"
#include "wf/Fmt.h"
#include "wf/Assert.h"

#include <string.h>
#include <type_traits>
#include <utility>

namespace wf
{
	// an error message (this type uses RAII to manage its memory), an empty message means no error
	struct Err
	{
		Str msg;

		// creates a new empty error (not an error)
		Err(): msg(str_new()) {}

		// creates a new error with the given error message
		template<typename... TArgs>
		Err(const char* fmt, TArgs&& ... args)
			:msg(strf(fmt, std::forward<TArgs>(args)...))
		{}

		Err(const Err& other)
			:msg(str_clone(other.msg))
		{}

		Err(Err&& other)
			:msg(other.msg)
		{
			other.msg = str_new();
		}

		~Err() { str_free(msg); }

		Err&
		operator=(const Err& other)
		{
			str_clear(msg);
			str_push(msg, other.msg);
			return *this;
		}

		Err&
		operator=(Err&& other)
		{
			str_free(msg);
			msg = other.msg;
			other.msg = str_new();
			return *this;
		}

		// casts the given error to a boolean, (false = no error, true = error exists)
		explicit operator bool() const { return msg.count != 0; }
		bool operator==(bool v) const { return (msg.count != 0) == v; }
		bool operator!=(bool v) const { return !operator==(v); }
	};

	// represents a result of a function which can fail, it holds either the value or the error
	// the value is zeroed when the result holds an error, so values must be plain structs or scalars
	template<typename T>
	struct Result
	{
		static_assert(!std::is_same_v<Err, T>, "Error can't be of the same type as value");

		T val;
		Err err;

		Result(Err e)
			:err(std::move(e))
		{
			wf_assert(err.msg.count > 0);
			::memset((void*)&val, 0, sizeof(val));
		}

		template<typename... TArgs>
		Result(TArgs&& ... args)
			:val(std::forward<TArgs>(args)...)
		{}

		Result(const Result&) = delete;

		Result(Result&&) = default;

		Result& operator=(const Result&) = delete;

		Result& operator=(Result&&) = default;

		~Result() = default;

		explicit operator bool() const { return !bool(err); }
		bool operator==(bool v) const { return !bool(err) == v; }
		bool operator!=(bool v) const { return !operator==(v); }
	};
}

namespace fmt
{
	template<>
	struct formatter<wf::Err>
	{
		template<typename ParseContext>
		constexpr auto
		parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto
		format(const wf::Err& err, FormatContext& ctx) const
		{
			return format_to(ctx.out(), "{}", err.msg);
		}
	};
}
