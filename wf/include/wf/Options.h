#pragma once

#include "wf/Exports.h"
#include "wf/Report.h"
#include "wf/Counter.h"
#include "wf/Result.h"

namespace wf
{
	// command line options of the word-freq tool
	struct Options
	{
		ORDER order;
		CASE_POLICY case_policy;
		// --help was passed, print the usage and do nothing else
		bool help;
		// the folder to scan, defaults to the current folder
		Str root;
	};

	// parses the command line arguments (argv[0] is the program name)
	// flags: --print-by-frequency, --case-sensitive, --help, and at most one positional folder
	WF_EXPORT Result<Options>
	options_parse(int argc, const char* const* argv);

	WF_EXPORT void
	options_free(Options& self);

	inline static void
	destruct(Options& self)
	{
		options_free(self);
	}

	// returns the usage text
	WF_EXPORT const char*
	options_usage();
}
