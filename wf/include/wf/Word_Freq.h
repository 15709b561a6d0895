#pragma once

#include "wf/Exports.h"
#include "wf/Str.h"
#include "wf/Str_Intern.h"
#include "wf/Counter.h"
#include "wf/Report.h"
#include "wf/Term.h"
#include "wf/Result.h"

namespace wf
{
	struct Word_Freq_Config
	{
		CASE_POLICY case_policy;
		WORD_POLICY word_policy;
		// initial capacity of the read buffer which is reused for every file
		size_t buffer_capacity;
	};

	// case insensitive, alnum words, 10MB read buffer
	inline static Word_Freq_Config
	word_freq_config_default()
	{
		Word_Freq_Config self{};
		self.case_policy = CASE_POLICY_INSENSITIVE;
		self.word_policy = WORD_POLICY_ALNUM;
		self.buffer_capacity = 10ULL * 1024ULL * 1024ULL;
		return self;
	}

	// the word frequency pipeline, it owns all the state of a run: the reusable read buffer, the interner
	// and the counting table
	struct IWord_Freq
	{
		Word_Freq_Config config;
		Str buf;
		Str_Intern intern;
		Counter counter;
		// count of files which made it into the counting table
		size_t files_counted;
		// count of files which failed to open, read, or were not utf-8
		size_t files_skipped;
	};
	typedef IWord_Freq* Word_Freq;

	WF_EXPORT Word_Freq
	word_freq_new(const Word_Freq_Config& config = word_freq_config_default());

	WF_EXPORT void
	word_freq_free(Word_Freq self);

	inline static void
	destruct(Word_Freq self)
	{
		word_freq_free(self);
	}

	// counts the words of the given text, returns an error (and counts nothing) if it's not valid utf-8
	WF_EXPORT Err
	word_freq_ingest_str(Word_Freq self, const Str& text);

	// reads the given file into the reusable buffer and counts its words
	// returns an error (and counts nothing from this file) if the file can't be opened, read, or isn't utf-8
	WF_EXPORT Err
	word_freq_ingest_file(Word_Freq self, const char* path);

	// walks the given folder and ingests every file found, per file failures are logged and skipped
	// the tmp allocator is cleared after each file, so tmp memory must not be held across this call
	// returns an error only if root is not a folder
	WF_EXPORT Err
	word_freq_ingest_folder(Word_Freq self, const char* root);

	// builds the ordered report rows of everything counted so far
	inline static Buf<Report_Row>
	word_freq_report(Word_Freq self, ORDER order, Allocator allocator = allocator_default())
	{
		return report_rows(self->counter, order, allocator);
	}
}
