#include "wf/Path.h"
#include "wf/File.h"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <dirent.h>
#include <errno.h>
#include <string.h>

namespace wf
{
	inline static Path_Entry::KIND
	_kind_from_mode(mode_t mode)
	{
		if (S_ISREG(mode))
			return Path_Entry::KIND_FILE;
		else if (S_ISDIR(mode))
			return Path_Entry::KIND_FOLDER;
		else if (S_ISLNK(mode))
			return Path_Entry::KIND_SYMLINK;
		else
			return Path_Entry::KIND_OTHER;
	}

	// API
	Err
	file_content_into(const char* filename, Str& out)
	{
		File f = file_open(filename, IO_MODE::READ, OPEN_MODE::OPEN_ONLY);
		if (f == nullptr)
			return Err{"Couldn't open {}: {}", filename, ::strerror(errno)};
		wf_defer(file_close(f));

		// the size is only a hint, the file might change while we read it
		auto size = file_size(f);
		if (size > 0)
			str_reserve(out, size_t(size));

		constexpr size_t READ_CHUNK = 64ULL * 1024ULL;
		while (true)
		{
			// one extra byte for the null terminator
			buf_reserve(out, READ_CHUNK + 1);
			auto read_size = file_read(f, Block{ out.ptr + out.count, out.cap - out.count - 1 });
			if (read_size < 0)
			{
				auto reason = ::strerror(errno);
				str_null_terminate(out);
				return Err{"Error while reading {}: {}", filename, reason};
			}
			if (read_size == 0)
				break;
			out.count += size_t(read_size);
		}
		str_null_terminate(out);
		return Err{};
	}

	Result<Buf<Path_Entry>>
	path_entries(const char* path, Allocator allocator)
	{
		DIR* d = ::opendir(path);
		if (d == nullptr)
			return Err{"{}", ::strerror(errno)};
		wf_defer(::closedir(d));

		auto res = buf_with_allocator<Path_Entry>(allocator);
		while (true)
		{
			errno = 0;
			struct dirent* dir = ::readdir(d);
			if (dir == nullptr)
			{
				if (errno != 0)
					log_warning("Error with folder entry in {}: {}", path, ::strerror(errno));
				break;
			}

			if (::strcmp(dir->d_name, ".") == 0 || ::strcmp(dir->d_name, "..") == 0)
				continue;

			Path_Entry entry{};
			switch (dir->d_type)
			{
			case DT_REG:
				entry.kind = Path_Entry::KIND_FILE;
				break;
			case DT_DIR:
				entry.kind = Path_Entry::KIND_FOLDER;
				break;
			case DT_LNK:
				entry.kind = Path_Entry::KIND_SYMLINK;
				break;
			case DT_UNKNOWN:
			{
				// some file systems don't fill d_type, so we ask the entry itself
				auto full_path = path_join(str_from_c(path), str_lit(dir->d_name));
				wf_defer(str_free(full_path));
				struct stat sb{};
				if (::lstat(full_path.ptr, &sb) != 0)
				{
					log_warning("Can't get the metadata of {}: {}", full_path, ::strerror(errno));
					continue;
				}
				entry.kind = _kind_from_mode(sb.st_mode);
				break;
			}
			default:
				entry.kind = Path_Entry::KIND_OTHER;
				break;
			}
			entry.name = str_from_c(dir->d_name, allocator);
			buf_push(res, entry);
		}
		return res;
	}

	Result<Path_Entry::KIND>
	path_kind(const char* path)
	{
		struct stat sb{};
		if (::stat(path, &sb) != 0)
			return Err{"{}", ::strerror(errno)};
		return _kind_from_mode(sb.st_mode);
	}

	bool
	path_is_folder(const char* path)
	{
		struct stat sb{};
		if (::stat(path, &sb) == 0)
			return S_ISDIR(sb.st_mode);
		return false;
	}

	bool
	path_is_file(const char* path)
	{
		struct stat sb{};
		if (::stat(path, &sb) == 0)
			return S_ISREG(sb.st_mode);
		return false;
	}

	bool
	folder_make(const char* path)
	{
		return ::mkdir(path, 0777) == 0;
	}

	bool
	folder_remove(const char* path)
	{
		auto entries = path_entries(path);
		if (entries.err)
			return false;
		wf_defer(destruct(entries.val));

		auto tmp_path = str_new();
		wf_defer(str_free(tmp_path));

		for (const auto& entry: entries.val)
		{
			str_clear(tmp_path);
			str_push(tmp_path, path);
			tmp_path = path_join(tmp_path, entry.name);

			if (entry.kind == Path_Entry::KIND_FOLDER)
			{
				if (folder_remove(tmp_path.ptr) == false)
					return false;
			}
			else
			{
				if (file_remove(tmp_path.ptr) == false)
					return false;
			}
		}

		return ::rmdir(path) == 0;
	}

	bool
	file_remove(const char* path)
	{
		return ::unlink(path) == 0;
	}
}
