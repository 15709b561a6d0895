#include <doctest/doctest.h>

#include <wf/Memory.h>
#include <wf/Buf.h>
#include <wf/Str.h>
#include <wf/Map.h>
#include <wf/Rune.h>
#include <wf/Str_Intern.h>
#include <wf/Term.h>
#include <wf/Result.h>
#include <wf/Fmt.h>
#include <wf/Defer.h>

#include <stdint.h>
#include <initializer_list>

// collects the text of every term so the tests can compare the whole split at once
inline static wf::Buf<wf::Str>
split(const char* text, wf::WORD_POLICY policy, wf::Buf<wf::TERM_KIND>* kinds = nullptr)
{
	auto res = wf::buf_with_allocator<wf::Str>(wf::memory::tmp());
	for (const auto& term: wf::terms(wf::str_lit(text), policy))
	{
		wf::buf_push(res, wf::str_from_substr(term.begin, term.end, wf::memory::tmp()));
		if (kinds)
			wf::buf_push(*kinds, term.kind);
	}
	return res;
}

inline static wf::Buf<wf::Str>
split_words(const char* text, wf::WORD_POLICY policy)
{
	auto res = wf::buf_with_allocator<wf::Str>(wf::memory::tmp());
	for (const auto& term: wf::terms(wf::str_lit(text), policy))
		if (term.kind == wf::TERM_KIND_WORD)
			wf::buf_push(res, wf::str_from_substr(term.begin, term.end, wf::memory::tmp()));
	return res;
}

TEST_CASE("allocation")
{
	auto b = wf::alloc(sizeof(int), alignof(int));
	CHECK(b.ptr != nullptr);
	CHECK(b.size != 0);

	wf::free(b);
}

TEST_CASE("arena allocator")
{
	auto arena = wf::allocator_arena_new(64);
	wf_defer(wf::allocator_arena_free(arena));

	auto small = wf::alloc_from(arena, 3, alignof(char));
	auto aligned = wf::alloc_from(arena, 8, 16);
	CHECK(small.size == 3);
	CHECK(uintptr_t(aligned.ptr) % 16 == 0);
	CHECK((char*)aligned.ptr >= (char*)small.ptr + small.size);
	CHECK(arena->head->next == nullptr);

	// bigger than the block size
	auto big = wf::alloc_from(arena, 1000, alignof(char));
	CHECK(big.size == 1000);
	CHECK(arena->head->next != nullptr);
	CHECK(arena->used_mem >= 1011);

	arena->clear_all();
	CHECK(arena->used_mem == 0);
	CHECK(arena->head != nullptr);
	CHECK(arena->head->next == nullptr);
	CHECK(arena->head->mem.size >= arena->highwater_mem);
}

TEST_CASE("tmp allocator")
{
	auto used = wf::memory::tmp()->used_mem;
	auto name = wf::str_tmpf("my name is {}", "word-freq");
	CHECK(name == "my name is word-freq");
	CHECK(name.allocator == wf::memory::tmp());
	CHECK(wf::memory::tmp()->used_mem > used);
}

TEST_CASE("default allocator")
{
	auto str = wf::str_from_c("default string");
	wf_defer(wf::str_free(str));
	CHECK(str.allocator == wf::allocator_default());
	CHECK(wf::allocator_default() == wf::memory::clib());
}

TEST_CASE("buf push and pop")
{
	auto arr = wf::buf_new<int>();
	wf_defer(wf::buf_free(arr));

	for (int i = 0; i < 10; ++i)
		wf::buf_push(arr, i);
	CHECK(arr.count == 10);

	int sum = 0;
	for (auto n: arr)
		sum += n;
	CHECK(sum == 45);

	CHECK(arr[9] == 9);

	auto cap = arr.cap;
	wf::buf_clear(arr);
	CHECK(arr.count == 0);
	CHECK(arr.cap == cap);
}

TEST_CASE("str push")
{
	auto str = wf::str_new();
	wf_defer(wf::str_free(str));

	wf::str_push(str, "word");
	wf::str_pushn(str, 3, '-');
	wf::str_push(str, wf::str_lit("freq"));
	CHECK(str == "word---freq");
	CHECK(str.ptr[str.count] == '\0');

	str = wf::strf(str, " {}", 42);
	CHECK(str == "word---freq 42");

	wf::str_clear(str);
	CHECK(str.count == 0);
	CHECK(str == "");
}

TEST_CASE("str ordering is byte wise lexicographic")
{
	CHECK(wf::str_lit("AF") > wf::str_lit("AEF"));
	CHECK(wf::str_lit("ABC") < wf::str_lit("DEF"));
	CHECK(wf::str_lit("ab") < wf::str_lit("abc"));
	CHECK(wf::str_lit("Zebra") < wf::str_lit("apple"));
	CHECK(wf::str_cmp(wf::str_lit("same"), wf::str_lit("same")) == 0);
	// bytes are unsigned, so multi byte runes come after ascii
	CHECK(wf::str_lit("z") < wf::str_lit("é"));
}

TEST_CASE("str fold")
{
	auto fold = [](const char* text) {
		return wf::str_fold(text, text + ::strlen(text), wf::memory::tmp());
	};

	CHECK(fold("Hello") == "hello");
	CHECK(fold("ÉCOLE") == "école");
	CHECK(fold("already folded") == "already folded");
	CHECK(fold("ΣΟΦΙΑ") == fold("σοφια"));
}

TEST_CASE("str width")
{
	CHECK(wf::str_width(wf::str_lit("abc")) == 3);
	CHECK(wf::str_width(wf::str_lit("école")) == 5);
	CHECK(wf::str_width(wf::str_lit("日本")) == 4);
	CHECK(wf::str_width(wf::str_lit("")) == 0);
}

TEST_CASE("set general cases")
{
	auto nums = wf::set_new<int*>();
	wf_defer(wf::set_free(nums));

	int values[100] = {};
	for (auto& v: values)
		wf::set_insert(nums, &v);
	CHECK(nums.count == 100);

	// duplicates are ignored
	wf::set_insert(nums, &values[0]);
	CHECK(nums.count == 100);

	for (auto& v: values)
		CHECK(wf::set_lookup(nums, &v) != nullptr);

	int other = 0;
	CHECK(wf::set_lookup(nums, &other) == nullptr);
}

TEST_CASE("map general cases")
{
	auto table = wf::map_new<wf::Str, size_t>();
	wf_defer(destruct(table));

	const char* words[] = {"one", "two", "three", "four", "five", "six", "seven", "eight", "nine", "ten",
		"eleven", "twelve", "thirteen", "fourteen", "fifteen", "sixteen", "seventeen", "eighteen"};
	for (size_t i = 0; i < sizeof(words) / sizeof(*words); ++i)
		wf::map_insert(table, wf::str_from_c(words[i]), i + 1);
	CHECK(table.count == 18);

	for (size_t i = 0; i < sizeof(words) / sizeof(*words); ++i)
	{
		auto it = wf::map_lookup(table, wf::str_lit(words[i]));
		REQUIRE(it != nullptr);
		CHECK(it->value == i + 1);
	}

	if (auto it = wf::map_lookup(table, wf::str_lit("one")))
		it->value = 100;
	CHECK(wf::map_lookup(table, wf::str_lit("one"))->value == 100);
	CHECK(wf::map_lookup(table, wf::str_lit("zero")) == nullptr);

	size_t sum = 0;
	for (const auto& [key, value]: table)
		sum += value;
	CHECK(sum == 100 + (18 * 19) / 2 - 1);
}

TEST_CASE("rune")
{
	const char text[] = "aé日\xF0\x9F\x98\x80";
	const char* end = text + sizeof(text) - 1;
	wf::Rune r = 0;

	CHECK(wf::rune_decode(text, end, &r) == 1);
	CHECK(r == 'a');
	CHECK(wf::rune_decode(text + 1, end, &r) == 2);
	CHECK(r == 0xE9);
	CHECK(wf::rune_decode(text + 3, end, &r) == 3);
	CHECK(r == 0x65E5);
	CHECK(wf::rune_decode(text + 6, end, &r) == 4);
	CHECK(r == 0x1F600);

	CHECK(wf::rune_valid_utf8(text, end));

	const char bad[] = "ab\xFF" "cd";
	CHECK(wf::rune_valid_utf8(bad, bad + sizeof(bad) - 1) == false);
	CHECK(wf::rune_decode(bad + 2, bad + sizeof(bad) - 1, &r) == -1);

	// truncated multi byte rune
	const char truncated[] = "\xE6\x97";
	CHECK(wf::rune_valid_utf8(truncated, truncated + 2) == false);

	CHECK(wf::rune_is_letter('x'));
	CHECK(wf::rune_is_letter(0x65E5));
	CHECK(wf::rune_is_number('7'));
	CHECK(wf::rune_is_number(0x0663));
	CHECK(wf::rune_is_mark(0x0301));
	CHECK(wf::rune_is_connector('_'));
	CHECK(wf::rune_is_letter(' ') == false);

	CHECK(wf::rune_is_alphabetic('x'));
	CHECK(wf::rune_is_alphabetic(0x093F));
	CHECK(wf::rune_is_alphabetic(0x24B6));
	CHECK(wf::rune_is_alphabetic(0x2160));
	CHECK(wf::rune_is_alphabetic(0x0301) == false);
	CHECK(wf::rune_is_alphabetic('7') == false);
	CHECK(wf::rune_is_alphabetic('_') == false);
}

TEST_CASE("err and result")
{
	wf::Err ok{};
	CHECK(bool(ok) == false);

	wf::Err err{"'{}' is not a folder", "x"};
	CHECK(bool(err));
	CHECK(err.msg == "'x' is not a folder");

	auto copy = err;
	CHECK(copy.msg == err.msg);
	CHECK(wf::str_tmpf("{}", copy) == "'x' is not a folder");

	auto half = [](int n) -> wf::Result<int> {
		if (n % 2)
			return wf::Err{"{} is odd", n};
		return n / 2;
	};

	auto a = half(10);
	CHECK(a.err == false);
	CHECK(a.val == 5);

	auto b = half(3);
	CHECK(b.err == true);
	CHECK(b.err.msg == "3 is odd");
	CHECK(b.val == 0);
}

TEST_CASE("Str_Intern general case")
{
	auto intern = wf::str_intern_new();
	wf_defer(wf::str_intern_free(intern));

	auto word = wf::str_intern(intern, "Mostafa");
	CHECK(word.ptr != nullptr);
	CHECK(word.count == 7);
	CHECK(word == wf::str_intern(intern, "Mostafa"));

	const char* big_str = "my name is Mostafa";
	const char* begin = big_str + 11;
	const char* end = begin + 7;
	CHECK(word == wf::str_intern(intern, begin, end));
	// interned bytes are a copy, not a pointer into the input
	CHECK(word.ptr != begin);
	CHECK(word.ptr[word.count] == '\0');

	CHECK(word != wf::str_intern(intern, "mostafa"));
	CHECK(wf::str_intern_count(intern) == 2);

	CHECK(wf::str_intern_find(intern, begin, end) == word);
	const char* missing = "missing";
	CHECK(wf::str_intern_find(intern, missing, missing + 7).ptr == nullptr);
	CHECK(wf::str_intern_count(intern) == 2);

	CHECK(wf::word_cmp(wf::str_intern(intern, "abc"), wf::str_intern(intern, "abd")) < 0);
	CHECK(wf::str_tmpf("<{}>", word) == "<Mostafa>");
}

TEST_CASE("Str_Intern many words")
{
	auto intern = wf::str_intern_new(128);
	wf_defer(wf::str_intern_free(intern));

	auto words = wf::buf_new<wf::Word>();
	wf_defer(wf::buf_free(words));

	for (size_t i = 0; i < 1000; ++i)
		wf::buf_push(words, wf::str_intern(intern, wf::str_tmpf("word{}", i)));
	CHECK(wf::str_intern_count(intern) == 1000);

	// growing the arena doesn't move the words handed out before
	for (size_t i = 0; i < 1000; ++i)
	{
		auto spelling = wf::str_tmpf("word{}", i);
		CHECK(wf::word_str(words[i]) == spelling);
		CHECK(words[i] == wf::str_intern(intern, spelling));
	}
}

TEST_CASE("term scanner splits words and symbols")
{
	auto kinds = wf::buf_with_allocator<wf::TERM_KIND>(wf::memory::tmp());
	auto parts = split("_abc.words();", wf::WORD_POLICY_ALNUM, &kinds);
	REQUIRE(parts.count == 4);
	CHECK(parts[0] == "_abc");
	CHECK(parts[1] == ".");
	CHECK(parts[2] == "words");
	CHECK(parts[3] == "();");
	CHECK(kinds[0] == wf::TERM_KIND_WORD);
	CHECK(kinds[1] == wf::TERM_KIND_SYMBOL);
	CHECK(kinds[2] == wf::TERM_KIND_WORD);
	CHECK(kinds[3] == wf::TERM_KIND_SYMBOL);
}

TEST_CASE("term scanner on empty and symbol only text")
{
	CHECK(split("", wf::WORD_POLICY_ALNUM).count == 0);

	auto kinds = wf::buf_with_allocator<wf::TERM_KIND>(wf::memory::tmp());
	auto parts = split("  ...  !!! \n", wf::WORD_POLICY_ALNUM, &kinds);
	REQUIRE(parts.count == 1);
	CHECK(kinds[0] == wf::TERM_KIND_SYMBOL);

	auto scanner = wf::term_scanner_new(wf::str_lit(""));
	wf::Term term{};
	CHECK(wf::term_scanner_next(scanner, term) == false);
}

TEST_CASE("term scanner reproduces the text")
{
	const char* texts[] = {
		"_abc.words();",
		"  leading and trailing spaces  ",
		"can't stop, won't stop",
		"3.14 is not 3,14 e.g. maybe",
		"héllo wörld, 日本語のテキスト",
		"cafe\xCC\x81 and ma\xC3\xB1" "ana",
		"broken \xFF\xFE bytes \xE6\x97 here",
		"\xFF",
		"word",
	};

	for (auto policy: {wf::WORD_POLICY_ALNUM, wf::WORD_POLICY_UNICODE})
	{
		for (auto text: texts)
		{
			auto joined = wf::str_with_allocator(wf::memory::tmp());
			bool first = true;
			auto prev_kind = wf::TERM_KIND_SYMBOL;
			for (const auto& term: wf::terms(wf::str_lit(text), policy))
			{
				CHECK(term.end > term.begin);
				if (first == false)
					CHECK(term.kind != prev_kind);
				first = false;
				prev_kind = term.kind;
				wf::str_block_push(joined, wf::Block{ (void*)term.begin, size_t(term.end - term.begin) });
			}
			CHECK(joined == text);
		}
	}
}

TEST_CASE("alnum word policy")
{
	auto words = split_words("can't _foo 'quoted' 3.14 e.g. héllo wörld", wf::WORD_POLICY_ALNUM);
	REQUIRE(words.count == 9);
	CHECK(words[0] == "can't");
	CHECK(words[1] == "_foo");
	CHECK(words[2] == "'quoted'");
	CHECK(words[3] == "3");
	CHECK(words[4] == "14");
	CHECK(words[5] == "e");
	CHECK(words[6] == "g");
	CHECK(words[7] == "héllo");
	CHECK(words[8] == "wörld");

	// dependent vowel signs and circled letters are alphabetic, so they don't break the word
	auto alphabetic = split_words("कि किताब ⒶⒷ1", wf::WORD_POLICY_ALNUM);
	REQUIRE(alphabetic.count == 3);
	CHECK(alphabetic[0] == "कि");
	CHECK(alphabetic[1] == "किताब");
	CHECK(alphabetic[2] == "ⒶⒷ1");

	// a combining acute accent isn't alphabetic
	auto accented = split("cafe\xCC\x81s", wf::WORD_POLICY_ALNUM);
	REQUIRE(accented.count == 3);
	CHECK(accented[0] == "cafe");
	CHECK(accented[1] == "\xCC\x81");
	CHECK(accented[2] == "s");

	auto parts = split("ab\xFF" "cd", wf::WORD_POLICY_ALNUM);
	REQUIRE(parts.count == 3);
	CHECK(parts[0] == "ab");
	CHECK(parts[1] == "\xFF");
	CHECK(parts[2] == "cd");
}

TEST_CASE("unicode word policy")
{
	auto words = split_words("can't _foo 'quoted' 3.14 1,000 e.g. a.1 end.", wf::WORD_POLICY_UNICODE);
	REQUIRE(words.count == 9);
	CHECK(words[0] == "can't");
	CHECK(words[1] == "_foo");
	CHECK(words[2] == "quoted");
	CHECK(words[3] == "3.14");
	CHECK(words[4] == "1,000");
	CHECK(words[5] == "e.g");
	CHECK(words[6] == "a");
	CHECK(words[7] == "1");
	CHECK(words[8] == "end");

	// combining marks stay with the letter they modify
	auto accented = split_words("cafe\xCC\x81 time", wf::WORD_POLICY_UNICODE);
	REQUIRE(accented.count == 2);
	CHECK(accented[0] == "cafe\xCC\x81");
	CHECK(accented[1] == "time");

	auto curly = split_words("don\xE2\x80\x99t", wf::WORD_POLICY_UNICODE);
	REQUIRE(curly.count == 1);
	CHECK(curly[0] == "don\xE2\x80\x99t");
}
