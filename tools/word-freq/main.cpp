#include <wf/Options.h>
#include <wf/Word_Freq.h>
#include <wf/File.h>
#include <wf/Fmt.h>
#include <wf/Log.h>
#include <wf/Defer.h>

int
main(int argc, char** argv)
{
	auto options = wf::options_parse(argc, argv);
	if (options.err)
	{
		wf::log_error("{}", options.err);
		wf::printerr("{}", wf::options_usage());
		return 1;
	}
	wf_defer(wf::options_free(options.val));

	if (options.val.help)
	{
		wf::print("{}", wf::options_usage());
		return 0;
	}

	auto config = wf::word_freq_config_default();
	config.case_policy = options.val.case_policy;

	auto freq = wf::word_freq_new(config);
	wf_defer(wf::word_freq_free(freq));

	// a root which is not a folder is the only fatal error, everything else is skipped with a message
	if (auto err = wf::word_freq_ingest_folder(freq, options.val.root.ptr))
	{
		wf::log_error("{}", err);
		return 1;
	}

	auto rows = wf::word_freq_report(freq, options.val.order);
	wf_defer(destruct(rows));

	auto out = wf::report_render(wf::str_new(), rows);
	wf_defer(wf::str_free(out));

	if (wf::file_write(wf::file_stdout(), wf::Block{ out.ptr, out.count }) < 0)
	{
		wf::log_error("Couldn't write the report to the standard output");
		return 1;
	}
	return 0;
}
