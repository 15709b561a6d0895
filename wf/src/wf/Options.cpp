#include "wf/Options.h"

#include <string.h>

namespace wf
{
	constexpr auto HELP_MSG = R"""(word-freq
counts the distinct words of every file found under a folder
'word-freq [FLAGS] [FOLDER]'
FOLDER defaults to the current folder
FLAGS:
  --print-by-frequency  orders the words by count, most frequent first, instead of alphabetically
  --case-sensitive      counts "Foo" and "foo" as different words
  --help                prints this message
)""";

	Result<Options>
	options_parse(int argc, const char* const* argv)
	{
		Options self{};
		self.order = ORDER_LEXICOGRAPHIC;
		self.case_policy = CASE_POLICY_INSENSITIVE;
		self.help = false;

		const char* root = nullptr;
		for (int i = 1; i < argc; ++i)
		{
			auto arg = str_lit(argv[i]);
			if (arg == "--print-by-frequency")
				self.order = ORDER_FREQUENCY;
			else if (arg == "--case-sensitive")
				self.case_policy = CASE_POLICY_SENSITIVE;
			else if (arg == "--help")
				self.help = true;
			else if (arg.count > 1 && arg.ptr[0] == '-')
				return Err{"unknown flag '{}'", arg};
			else if (root != nullptr)
				return Err{"unexpected argument '{}', only one folder can be scanned", arg};
			else
				root = argv[i];
		}

		self.root = str_from_c(root ? root : ".");
		return self;
	}

	void
	options_free(Options& self)
	{
		str_free(self.root);
	}

	const char*
	options_usage()
	{
		return HELP_MSG;
	}
}
