#pragma once

#include "wf/Exports.h"
#include "wf/Base.h"

#include <stdint.h>

namespace wf
{
	// a file handle
	struct IFile
	{
		int linux_handle;
	};
	typedef IFile* File;

	// specifies the io mode of a file
	enum class IO_MODE
	{
		READ,
		WRITE
	};

	// specifies what to do when opening a file
	enum class OPEN_MODE
	{
		// opens the file only if it exists
		OPEN_ONLY,
		// creates the file if it doesn't exist and truncates it otherwise
		CREATE_OVERWRITE
	};

	// returns a handle to the standard output stream
	WF_EXPORT File
	file_stdout();

	// returns a handle to the standard error stream
	WF_EXPORT File
	file_stderr();

	// opens a file, returns nullptr on failure and leaves errno as the os left it
	WF_EXPORT File
	file_open(const char* filename, IO_MODE io_mode, OPEN_MODE open_mode);

	// closes the given file, standard streams are left open
	WF_EXPORT void
	file_close(File self);

	// reads into the given block, returns the number of bytes read, 0 at the end of the file, or -1 on error
	WF_EXPORT int64_t
	file_read(File self, Block data);

	// writes the entire block, returns the number of bytes written or -1 on error
	WF_EXPORT int64_t
	file_write(File self, Block data);

	// returns the size of the file in bytes, or -1 on error
	WF_EXPORT int64_t
	file_size(File self);
}
