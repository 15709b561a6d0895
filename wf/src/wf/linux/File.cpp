#include "wf/File.h"
#include "wf/Memory.h"

#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

namespace wf
{
	inline static bool
	_is_std_file(File self)
	{
		return self == file_stdout() || self == file_stderr();
	}

	// API
	File
	file_stdout()
	{
		static IFile _stdout{ STDOUT_FILENO };
		return &_stdout;
	}

	File
	file_stderr()
	{
		static IFile _stderr{ STDERR_FILENO };
		return &_stderr;
	}

	File
	file_open(const char* filename, IO_MODE io_mode, OPEN_MODE open_mode)
	{
		int flags = O_CLOEXEC;

		switch (io_mode)
		{
		case IO_MODE::READ:
			flags |= O_RDONLY;
			break;
		case IO_MODE::WRITE:
		default:
			flags |= O_WRONLY;
			break;
		}

		switch (open_mode)
		{
		case OPEN_MODE::OPEN_ONLY:
			break;
		case OPEN_MODE::CREATE_OVERWRITE:
		default:
			flags |= O_CREAT;
			flags |= O_TRUNC;
			break;
		}

		int linux_handle = ::open(filename, flags, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
		if (linux_handle == -1)
			return nullptr;

		File self = alloc_construct<IFile>();
		self->linux_handle = linux_handle;
		return self;
	}

	void
	file_close(File self)
	{
		if (self == nullptr || _is_std_file(self))
			return;
		::close(self->linux_handle);
		free_destruct(self);
	}

	int64_t
	file_read(File self, Block data)
	{
		while (true)
		{
			auto res = ::read(self->linux_handle, data.ptr, data.size);
			if (res == -1 && errno == EINTR)
				continue;
			return res;
		}
	}

	int64_t
	file_write(File self, Block data)
	{
		auto it = (const char*)data.ptr;
		size_t written = 0;
		while (written < data.size)
		{
			auto res = ::write(self->linux_handle, it + written, data.size - written);
			if (res == -1)
			{
				if (errno == EINTR)
					continue;
				return -1;
			}
			written += size_t(res);
		}
		return int64_t(written);
	}

	int64_t
	file_size(File self)
	{
		struct stat file_stats;
		if (::fstat(self->linux_handle, &file_stats) == 0)
			return file_stats.st_size;
		return -1;
	}
}
