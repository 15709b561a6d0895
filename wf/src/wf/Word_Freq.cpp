#include "wf/Word_Freq.h"
#include "wf/Path.h"
#include "wf/Log.h"

namespace wf
{
	Word_Freq
	word_freq_new(const Word_Freq_Config& config)
	{
		auto self = alloc_construct<IWord_Freq>();
		self->config = config;
		self->buf = str_new();
		str_reserve(self->buf, config.buffer_capacity);
		self->intern = str_intern_new();
		self->counter = counter_new(&self->intern, config.case_policy);
		self->files_counted = 0;
		self->files_skipped = 0;
		return self;
	}

	void
	word_freq_free(Word_Freq self)
	{
		str_free(self->buf);
		counter_free(self->counter);
		str_intern_free(self->intern);
		free_destruct(self);
	}

	Err
	word_freq_ingest_str(Word_Freq self, const Str& text)
	{
		if (rune_valid_utf8(text.ptr, text.ptr + text.count) == false)
			return Err{"text is not utf-8"};
		counter_feed(self->counter, text, self->config.word_policy);
		return Err{};
	}

	Err
	word_freq_ingest_file(Word_Freq self, const char* path)
	{
		// the buffer is cleared and not freed so its memory is reused by the next file
		str_clear(self->buf);

		if (auto err = file_content_into(path, self->buf))
			return err;

		if (rune_valid_utf8(self->buf.ptr, self->buf.ptr + self->buf.count) == false)
			return Err{"{} is not utf-8", path};

		counter_feed(self->counter, self->buf, self->config.word_policy);
		return Err{};
	}

	Err
	word_freq_ingest_folder(Word_Freq self, const char* root)
	{
		auto err = walk_files(root, [self](const Str& path) {
			if (auto file_err = word_freq_ingest_file(self, path.ptr))
			{
				log_error("{}", file_err);
				++self->files_skipped;
			}
			else
			{
				++self->files_counted;
			}
			// everything the tmp allocator holds now belongs to the file we just finished
			memory::tmp()->clear_all();
		});
		if (err)
			return err;

		log_debug(
			"counted {} files, skipped {} files, {} distinct words",
			self->files_counted,
			self->files_skipped,
			counter_distinct(self->counter)
		);
		return Err{};
	}
}
