#pragma once

namespace wf
{
	template<typename F>
	struct Defer
	{
		F f;
		Defer(F f) : f(f) {}
		~Defer() { f(); }
	};

	template<typename F>
	inline static Defer<F>
	make_defer(F f)
	{
		return Defer<F>(f);
	}

	#define wf_DEFER_1(x, y) x##y
	#define wf_DEFER_2(x, y) wf_DEFER_1(x, y)
	#define wf_DEFER_3(x)    wf_DEFER_2(x, __COUNTER__)
	#define wf_defer(code)   auto wf_DEFER_3(_defer_) = wf::make_defer([&](){code;})
}
