#include <doctest/doctest.h>

#include <wf/Counter.h>
#include <wf/Report.h>
#include <wf/Options.h>
#include <wf/Word_Freq.h>
#include <wf/Path.h>
#include <wf/File.h>
#include <wf/Log.h>
#include <wf/Defer.h>

#include <unistd.h>
#include <sys/stat.h>

// counts the warnings and errors emitted while it's installed
struct Log_Counter
{
	size_t warnings;
	size_t errors;
	wf::Str last_error;
	wf::Log_Interface old_log;
};

inline static Log_Counter*
log_counter_new()
{
	auto self = wf::alloc_construct<Log_Counter>();
	self->last_error = wf::str_new();

	wf::Log_Interface log{};
	log.self = self;
	log.warning = [](void* self, const char*) {
		++((Log_Counter*)self)->warnings;
	};
	log.error = [](void* self, const char* msg) {
		auto counter = (Log_Counter*)self;
		++counter->errors;
		wf::str_clear(counter->last_error);
		wf::str_push(counter->last_error, msg);
	};
	self->old_log = wf::log_interface_set(log);
	return self;
}

inline static void
log_counter_free(Log_Counter* self)
{
	wf::log_interface_set(self->old_log);
	wf::str_free(self->last_error);
	wf::free_destruct(self);
}

// a fresh folder under /tmp which is removed with everything inside it
struct Temp_Folder
{
	wf::Str path;
};

inline static Temp_Folder
temp_folder_new()
{
	static size_t counter = 0;
	Temp_Folder self{};
	self.path = wf::strf("/tmp/wf-unittest-{}-{}", ::getpid(), counter++);
	wf::folder_remove(self.path.ptr);
	wf::folder_make(self.path.ptr);
	return self;
}

inline static void
temp_folder_free(Temp_Folder& self)
{
	wf::folder_remove(self.path.ptr);
	wf::str_free(self.path);
}

// returns root/name, the result is owned by the caller
inline static wf::Str
child(const Temp_Folder& self, const char* name)
{
	return wf::path_join(wf::str_clone(self.path), wf::str_lit(name));
}

inline static void
write_file(const Temp_Folder& self, const char* name, const char* content)
{
	auto path = child(self, name);
	wf_defer(wf::str_free(path));

	auto f = wf::file_open(path.ptr, wf::IO_MODE::WRITE, wf::OPEN_MODE::CREATE_OVERWRITE);
	REQUIRE(f != nullptr);
	wf_defer(wf::file_close(f));
	CHECK(wf::file_write(f, wf::Block{ (void*)content, ::strlen(content) }) == int64_t(::strlen(content)));
}

inline static void
make_folder(const Temp_Folder& self, const char* name)
{
	auto path = child(self, name);
	wf_defer(wf::str_free(path));
	REQUIRE(wf::folder_make(path.ptr));
}

inline static void
make_symlink(const Temp_Folder& self, const char* target, const char* name)
{
	auto target_path = child(self, target);
	wf_defer(wf::str_free(target_path));
	auto link_path = child(self, name);
	wf_defer(wf::str_free(link_path));
	REQUIRE(::symlink(target_path.ptr, link_path.ptr) == 0);
}

// runs the whole pipeline over the folder and returns the rendered report
inline static wf::Str
run(const Temp_Folder& folder, wf::CASE_POLICY case_policy, wf::ORDER order, size_t* files_counted = nullptr)
{
	auto config = wf::word_freq_config_default();
	config.case_policy = case_policy;
	config.buffer_capacity = 1024;

	auto freq = wf::word_freq_new(config);
	wf_defer(wf::word_freq_free(freq));

	auto err = wf::word_freq_ingest_folder(freq, folder.path.ptr);
	CHECK(err == false);
	if (files_counted)
		*files_counted = freq->files_counted;

	auto rows = wf::word_freq_report(freq, order);
	wf_defer(wf::buf_free(rows));
	return wf::report_render(wf::str_new(), rows);
}

inline static wf::Str
render_text(const char* text, wf::CASE_POLICY case_policy, wf::ORDER order)
{
	auto intern = wf::str_intern_new();
	wf_defer(wf::str_intern_free(intern));
	auto counter = wf::counter_new(&intern, case_policy);
	wf_defer(wf::counter_free(counter));

	wf::counter_feed(counter, wf::str_lit(text));
	auto rows = wf::report_rows(counter, order);
	wf_defer(wf::buf_free(rows));
	return wf::report_render(wf::str_new(), rows);
}

TEST_CASE("counter case insensitive")
{
	auto intern = wf::str_intern_new();
	wf_defer(wf::str_intern_free(intern));
	auto counter = wf::counter_new(&intern);
	wf_defer(wf::counter_free(counter));

	wf::counter_feed(counter, wf::str_lit("Foo foo FOO, bar"));
	CHECK(wf::counter_distinct(counter) == 2);
	CHECK(wf::counter_total(counter) == 4);
	CHECK(wf::counter_count(counter, "foo") == 3);
	CHECK(wf::counter_count(counter, "FoO") == 3);
	CHECK(wf::counter_count(counter, "bar") == 1);
	CHECK(wf::counter_count(counter, "baz") == 0);

	// the first spelling seen is the one shown
	auto entry = wf::counter_lookup(counter, "foo");
	REQUIRE(entry != nullptr);
	CHECK(wf::word_str(entry->value.display) == "Foo");
	CHECK(wf::word_str(entry->key) == "foo");
}

TEST_CASE("counter case sensitive")
{
	auto intern = wf::str_intern_new();
	wf_defer(wf::str_intern_free(intern));
	auto counter = wf::counter_new(&intern, wf::CASE_POLICY_SENSITIVE);
	wf_defer(wf::counter_free(counter));

	wf::counter_feed(counter, wf::str_lit("Foo foo FOO foo"));
	CHECK(wf::counter_distinct(counter) == 3);
	CHECK(wf::counter_count(counter, "Foo") == 1);
	CHECK(wf::counter_count(counter, "foo") == 2);
	CHECK(wf::counter_count(counter, "FOO") == 1);
	CHECK(wf::counter_count(counter, "fOO") == 0);
}

TEST_CASE("counter folds unicode case")
{
	auto intern = wf::str_intern_new();
	wf_defer(wf::str_intern_free(intern));
	auto counter = wf::counter_new(&intern);
	wf_defer(wf::counter_free(counter));

	wf::counter_feed(counter, wf::str_lit("ÉCOLE école École"));
	CHECK(wf::counter_distinct(counter) == 1);
	CHECK(wf::counter_count(counter, "école") == 3);
	CHECK(wf::counter_count(counter, "ÉCOLE") == 3);

	auto entry = wf::counter_lookup(counter, "école");
	REQUIRE(entry != nullptr);
	CHECK(wf::word_str(entry->value.display) == "ÉCOLE");
}

TEST_CASE("counter words are interned once")
{
	auto intern = wf::str_intern_new();
	wf_defer(wf::str_intern_free(intern));
	auto counter = wf::counter_new(&intern, wf::CASE_POLICY_SENSITIVE);
	wf_defer(wf::counter_free(counter));

	wf::counter_feed(counter, wf::str_lit("a b a b a b c"));
	CHECK(wf::str_intern_count(intern) == 3);
	CHECK(wf::counter_total(counter) == 7);
}

TEST_CASE("symbol only text counts nothing")
{
	auto intern = wf::str_intern_new();
	wf_defer(wf::str_intern_free(intern));
	auto counter = wf::counter_new(&intern);
	wf_defer(wf::counter_free(counter));

	wf::counter_feed(counter, wf::str_lit("  ...  !!! ();\n\t"));
	CHECK(wf::counter_distinct(counter) == 0);
	CHECK(wf::counter_total(counter) == 0);

	auto rows = wf::report_rows(counter, wf::ORDER_LEXICOGRAPHIC);
	wf_defer(wf::buf_free(rows));
	CHECK(rows.count == 0);

	auto out = wf::report_render(wf::str_new(), rows);
	wf_defer(wf::str_free(out));
	CHECK(out == "");
}

TEST_CASE("report orders")
{
	auto lexicographic = render_text("b a b c a", wf::CASE_POLICY_INSENSITIVE, wf::ORDER_LEXICOGRAPHIC);
	wf_defer(wf::str_free(lexicographic));
	CHECK(lexicographic == "a: 2\nb: 2\nc: 1\n");

	// ties on count are broken by the word
	auto frequency = render_text("c b a b a", wf::CASE_POLICY_INSENSITIVE, wf::ORDER_FREQUENCY);
	wf_defer(wf::str_free(frequency));
	CHECK(frequency == "a: 2\nb: 2\nc: 1\n");

	auto most_frequent = render_text("x y y z z z", wf::CASE_POLICY_INSENSITIVE, wf::ORDER_FREQUENCY);
	wf_defer(wf::str_free(most_frequent));
	CHECK(most_frequent == "z: 3\ny: 2\nx: 1\n");
}

TEST_CASE("report orders by the count key")
{
	// case insensitive rows are ordered by the folded spelling
	auto insensitive = render_text("Zebra apple", wf::CASE_POLICY_INSENSITIVE, wf::ORDER_LEXICOGRAPHIC);
	wf_defer(wf::str_free(insensitive));
	CHECK(insensitive == "apple: 1\nZebra: 1\n");

	// case sensitive rows are ordered by bytes, upper case comes first
	auto sensitive = render_text("Zebra apple", wf::CASE_POLICY_SENSITIVE, wf::ORDER_LEXICOGRAPHIC);
	wf_defer(wf::str_free(sensitive));
	CHECK(sensitive == "Zebra: 1\napple: 1\n");
}

TEST_CASE("report render pads words to the right")
{
	auto out = render_text("a bb ccc bb", wf::CASE_POLICY_INSENSITIVE, wf::ORDER_LEXICOGRAPHIC);
	wf_defer(wf::str_free(out));
	CHECK(out == "  a: 1\n bb: 2\nccc: 1\n");

	// wide runes take two columns
	auto wide = render_text("日本 ab", wf::CASE_POLICY_INSENSITIVE, wf::ORDER_LEXICOGRAPHIC);
	wf_defer(wf::str_free(wide));
	CHECK(wide == "  ab: 1\n日本: 1\n");
}

TEST_CASE("report width")
{
	auto intern = wf::str_intern_new();
	wf_defer(wf::str_intern_free(intern));
	auto counter = wf::counter_new(&intern);
	wf_defer(wf::counter_free(counter));

	wf::counter_feed(counter, wf::str_lit("short école longest"));
	auto rows = wf::report_rows(counter, wf::ORDER_FREQUENCY);
	wf_defer(wf::buf_free(rows));
	CHECK(rows.count == 3);
	CHECK(wf::report_width(rows) == 7);
}

TEST_CASE("options defaults")
{
	const char* argv[] = {"word-freq"};
	auto options = wf::options_parse(1, argv);
	REQUIRE(options.err == false);
	wf_defer(wf::options_free(options.val));

	CHECK(options.val.order == wf::ORDER_LEXICOGRAPHIC);
	CHECK(options.val.case_policy == wf::CASE_POLICY_INSENSITIVE);
	CHECK(options.val.help == false);
	CHECK(options.val.root == ".");
}

TEST_CASE("options flags")
{
	const char* argv[] = {"word-freq", "--case-sensitive", "some/folder", "--print-by-frequency"};
	auto options = wf::options_parse(4, argv);
	REQUIRE(options.err == false);
	wf_defer(wf::options_free(options.val));

	CHECK(options.val.order == wf::ORDER_FREQUENCY);
	CHECK(options.val.case_policy == wf::CASE_POLICY_SENSITIVE);
	CHECK(options.val.root == "some/folder");

	const char* help_argv[] = {"word-freq", "--help"};
	auto help = wf::options_parse(2, help_argv);
	REQUIRE(help.err == false);
	wf_defer(wf::options_free(help.val));
	CHECK(help.val.help);
}

TEST_CASE("options errors")
{
	const char* unknown[] = {"word-freq", "--sort"};
	auto a = wf::options_parse(2, unknown);
	CHECK(a.err == true);
	CHECK(a.err.msg == "unknown flag '--sort'");

	const char* extra[] = {"word-freq", "one", "two"};
	auto b = wf::options_parse(3, extra);
	CHECK(b.err == true);

	CHECK(::strstr(wf::options_usage(), "--print-by-frequency") != nullptr);
	CHECK(::strstr(wf::options_usage(), "--case-sensitive") != nullptr);
}

TEST_CASE("word freq over a folder")
{
	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	write_file(folder, "animals.txt", "cat dog Cat");

	auto insensitive = run(folder, wf::CASE_POLICY_INSENSITIVE, wf::ORDER_LEXICOGRAPHIC);
	wf_defer(wf::str_free(insensitive));
	CHECK(insensitive == "cat: 2\ndog: 1\n");

	auto sensitive = run(folder, wf::CASE_POLICY_SENSITIVE, wf::ORDER_LEXICOGRAPHIC);
	wf_defer(wf::str_free(sensitive));
	CHECK(sensitive == "Cat: 1\ncat: 1\ndog: 1\n");
}

TEST_CASE("word freq walks nested folders")
{
	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	make_folder(folder, "sub");
	make_folder(folder, "sub/deeper");
	make_folder(folder, "empty");
	write_file(folder, "a.txt", "one two");
	write_file(folder, "sub/b.txt", "two three");
	write_file(folder, "sub/deeper/c.txt", "three");
	// an empty file is still a counted file
	write_file(folder, "sub/deeper/empty.txt", "");

	size_t files_counted = 0;
	auto out = run(folder, wf::CASE_POLICY_INSENSITIVE, wf::ORDER_FREQUENCY, &files_counted);
	wf_defer(wf::str_free(out));
	CHECK(out == "three: 2\n  two: 2\n  one: 1\n");
	CHECK(files_counted == 4);
}

TEST_CASE("word freq follows symlinks")
{
	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	make_folder(folder, "real");
	write_file(folder, "real/x.txt", "word");
	make_symlink(folder, "real/x.txt", "link_file");
	make_symlink(folder, "real", "link_folder");

	size_t files_counted = 0;
	auto out = run(folder, wf::CASE_POLICY_INSENSITIVE, wf::ORDER_LEXICOGRAPHIC, &files_counted);
	wf_defer(wf::str_free(out));
	CHECK(out == "word: 3\n");
	CHECK(files_counted == 3);
}

TEST_CASE("word freq skips what it can't read")
{
	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	write_file(folder, "good.txt", "abc def");
	write_file(folder, "bad.bin", "abc \xFF\xFE def");
	make_symlink(folder, "missing", "dangling");

	auto log = log_counter_new();
	wf_defer(log_counter_free(log));

	auto freq = wf::word_freq_new();
	wf_defer(wf::word_freq_free(freq));

	auto err = wf::word_freq_ingest_folder(freq, folder.path.ptr);
	CHECK(err == false);
	CHECK(freq->files_counted == 1);
	CHECK(freq->files_skipped == 1);
	CHECK(wf::counter_count(freq->counter, "abc") == 1);
	CHECK(wf::counter_count(freq->counter, "def") == 1);

	// the broken symlink is an enumeration problem, the non utf-8 file is a file problem
	CHECK(log->warnings == 1);
	CHECK(log->errors == 1);
	CHECK(::strstr(log->last_error.ptr, "is not utf-8") != nullptr);
}

TEST_CASE("word freq skips unreadable files")
{
	// permissions don't stop root from reading
	if (::geteuid() == 0)
		return;

	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	write_file(folder, "readable.txt", "open");
	write_file(folder, "locked.txt", "closed");

	auto locked = child(folder, "locked.txt");
	wf_defer(wf::str_free(locked));
	REQUIRE(::chmod(locked.ptr, 0) == 0);

	auto log = log_counter_new();
	wf_defer(log_counter_free(log));

	auto freq = wf::word_freq_new();
	wf_defer(wf::word_freq_free(freq));

	CHECK(wf::word_freq_ingest_folder(freq, folder.path.ptr) == false);
	CHECK(freq->files_counted == 1);
	CHECK(freq->files_skipped == 1);
	CHECK(wf::counter_count(freq->counter, "open") == 1);
	CHECK(wf::counter_count(freq->counter, "closed") == 0);
	CHECK(log->errors == 1);
	CHECK(::strstr(log->last_error.ptr, "Couldn't open") != nullptr);
}

TEST_CASE("word freq root must be a folder")
{
	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	write_file(folder, "file.txt", "text");

	auto file_path = child(folder, "file.txt");
	wf_defer(wf::str_free(file_path));
	auto missing_path = child(folder, "missing");
	wf_defer(wf::str_free(missing_path));

	auto freq = wf::word_freq_new();
	wf_defer(wf::word_freq_free(freq));

	auto err = wf::word_freq_ingest_folder(freq, file_path.ptr);
	CHECK(err == true);
	CHECK(::strstr(err.msg.ptr, "is not a folder") != nullptr);

	CHECK(wf::word_freq_ingest_folder(freq, missing_path.ptr) == true);
	CHECK(freq->files_counted == 0);
	CHECK(wf::counter_distinct(freq->counter) == 0);
}

TEST_CASE("word freq file and text ingestion")
{
	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	write_file(folder, "a.txt", "reused buffer");
	write_file(folder, "b.txt", "buffer");

	auto a_path = child(folder, "a.txt");
	wf_defer(wf::str_free(a_path));
	auto b_path = child(folder, "b.txt");
	wf_defer(wf::str_free(b_path));
	auto missing_path = child(folder, "missing.txt");
	wf_defer(wf::str_free(missing_path));

	auto config = wf::word_freq_config_default();
	config.buffer_capacity = 4;
	auto freq = wf::word_freq_new(config);
	wf_defer(wf::word_freq_free(freq));

	CHECK(wf::word_freq_ingest_file(freq, a_path.ptr) == false);
	CHECK(wf::word_freq_ingest_file(freq, b_path.ptr) == false);
	CHECK(wf::counter_count(freq->counter, "buffer") == 2);
	CHECK(wf::counter_count(freq->counter, "reused") == 1);

	auto err = wf::word_freq_ingest_file(freq, missing_path.ptr);
	CHECK(err == true);
	CHECK(::strstr(err.msg.ptr, "Couldn't open") != nullptr);

	CHECK(wf::word_freq_ingest_str(freq, wf::str_lit("more Buffer")) == false);
	CHECK(wf::counter_count(freq->counter, "buffer") == 3);

	CHECK(wf::word_freq_ingest_str(freq, wf::str_lit("bad \xFF buffer")) == true);
	CHECK(wf::counter_count(freq->counter, "buffer") == 3);
}

TEST_CASE("walk files visits shallow files first")
{
	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	make_folder(folder, "a");
	make_folder(folder, "a/b");
	make_folder(folder, "c");
	write_file(folder, "a/b/deep.txt", "x");
	write_file(folder, "a/mid.txt", "x");
	write_file(folder, "c/mid.txt", "x");
	write_file(folder, "top.txt", "x");

	auto visited = wf::buf_new<wf::Str>();
	wf_defer(destruct(visited));
	auto err = wf::walk_files(folder.path.ptr, [&](const wf::Str& path) {
		// relative to the root
		wf::buf_push(visited, wf::str_from_c(path.ptr + folder.path.count + 1));
	});
	CHECK(err == false);
	REQUIRE(visited.count == 4);

	size_t last_depth = 0;
	for (const auto& path: visited)
	{
		size_t depth = 0;
		for (auto c: path)
			if (c == '/')
				++depth;
		CHECK(depth >= last_depth);
		last_depth = depth;
	}
	CHECK(visited[0] == "top.txt");
	CHECK(visited[3] == "a/b/deep.txt");
	CHECK(((visited[1] == "a/mid.txt" && visited[2] == "c/mid.txt") ||
		   (visited[1] == "c/mid.txt" && visited[2] == "a/mid.txt")));
}

TEST_CASE("path entries")
{
	auto folder = temp_folder_new();
	wf_defer(temp_folder_free(folder));
	write_file(folder, "file.txt", "x");
	make_folder(folder, "sub");
	make_symlink(folder, "file.txt", "link");

	auto entries = wf::path_entries(folder.path.ptr);
	REQUIRE(entries.err == false);
	wf_defer(destruct(entries.val));
	CHECK(entries.val.count == 3);

	size_t files = 0, folders = 0, symlinks = 0;
	for (const auto& entry: entries.val)
	{
		CHECK(entry.name != ".");
		CHECK(entry.name != "..");
		if (entry.kind == wf::Path_Entry::KIND_FILE)
			++files;
		else if (entry.kind == wf::Path_Entry::KIND_FOLDER)
			++folders;
		else if (entry.kind == wf::Path_Entry::KIND_SYMLINK)
			++symlinks;
	}
	CHECK(files == 1);
	CHECK(folders == 1);
	CHECK(symlinks == 1);

	auto link = child(folder, "link");
	wf_defer(wf::str_free(link));
	auto kind = wf::path_kind(link.ptr);
	REQUIRE(kind.err == false);
	CHECK(kind.val == wf::Path_Entry::KIND_FILE);

	CHECK(wf::path_is_folder(folder.path.ptr));
	CHECK(wf::path_is_file(link.ptr));
	CHECK(wf::path_entries("/definitely/not/a/folder").err == true);
}
