#pragma once

#include "wf/Exports.h"
#include "wf/Str.h"
#include "wf/Result.h"
#include "wf/Log.h"
#include "wf/Defer.h"

namespace wf
{
	// reads the entire content of the given file and appends it to out, out is not cleared so the caller can reuse
	// the same buffer for many files, on failure out might contain a partial read
	WF_EXPORT Err
	file_content_into(const char* filename, Str& out);

	// represents a file system entity
	struct Path_Entry
	{
		enum KIND
		{
			KIND_FILE,
			KIND_FOLDER,
			KIND_SYMLINK,
			// sockets, fifos, devices
			KIND_OTHER
		};

		KIND kind;
		Str  name;
	};

	// frees the given path entry
	inline static void
	path_entry_free(Path_Entry& self)
	{
		str_free(self.name);
	}

	// destruct overload of path entry free
	inline static void
	destruct(Path_Entry& self)
	{
		path_entry_free(self);
	}

	// returns the children files/folders of the given path, excluding "." and ".."
	// symlinks are reported as KIND_SYMLINK and are not followed
	WF_EXPORT Result<Buf<Path_Entry>>
	path_entries(const char* path, Allocator allocator = allocator_default());

	// returns the kind of the given path following symlinks, so it never returns KIND_SYMLINK
	WF_EXPORT Result<Path_Entry::KIND>
	path_kind(const char* path);

	// returns whether the given path is a folder (follows symlinks)
	WF_EXPORT bool
	path_is_folder(const char* path);

	// returns whether the given path is a file (follows symlinks)
	WF_EXPORT bool
	path_is_file(const char* path);

	// appends the given name to base separated by a single '/'
	// base = path_join(base, "my_file") = "base_folder/my_file"
	inline static Str
	path_join(Str base, const Str& name)
	{
		if (base.count > 0 && base.ptr[base.count - 1] != '/')
			str_push(base, "/");
		str_push(base, name);
		return base;
	}

	// creates a new folder and returns whether it succeeded
	WF_EXPORT bool
	folder_make(const char* path);

	// removes the given folder and everything inside it, symlinks are removed and not followed
	WF_EXPORT bool
	folder_remove(const char* path);

	// removes a file (or a symlink), and returns whether the operation is successful
	WF_EXPORT bool
	file_remove(const char* path);

	// walks the folder tree rooted at root breadth first and calls on_file(const Str& path) for each file found,
	// symlinks are resolved to their target kind, folders are walked, files are passed to on_file
	// problems with individual entries are logged as warnings and skipped
	// note: a symlink cycle makes the walk go on forever, it's up to the caller to not point it at one
	// returns an error (without calling on_file) only when root is not a folder
	template<typename TFunc>
	inline static Err
	walk_files(const char* root, TFunc&& on_file)
	{
		if (path_is_folder(root) == false)
			return Err{"'{}' is not a folder", root};

		auto queue = buf_new<Str>();
		wf_defer(destruct(queue));
		buf_push(queue, str_from_c(root));

		for (size_t head = 0; head < queue.count; ++head)
		{
			// copy the handle, pushing into the queue might move the buf memory but not the string bytes
			Str folder = queue[head];
			// the folder's path is released once its entries are queued, only pending folders stay alive
			wf_defer(str_free(queue[head]));

			auto entries = path_entries(folder.ptr);
			if (entries.err)
			{
				log_warning("Can't read folder {}: {}", folder, entries.err);
				continue;
			}
			wf_defer(destruct(entries.val));

			for (const auto& entry: entries.val)
			{
				auto path = path_join(str_clone(folder), entry.name);

				auto kind = entry.kind;
				if (kind == Path_Entry::KIND_SYMLINK)
				{
					auto target = path_kind(path.ptr);
					if (target.err)
					{
						log_warning("Can't resolve symlink {}: {}", path, target.err);
						str_free(path);
						continue;
					}
					kind = target.val;
					if (kind == Path_Entry::KIND_OTHER)
					{
						log_warning("Found symlink {} but it's not a file or a folder", path);
						str_free(path);
						continue;
					}
				}

				switch (kind)
				{
				case Path_Entry::KIND_FOLDER:
					buf_push(queue, path);
					break;
				case Path_Entry::KIND_FILE:
					on_file(path);
					str_free(path);
					break;
				default:
					log_warning("Found {} but it's not a file, folder, or symlink", path);
					str_free(path);
					break;
				}
			}
		}
		return Err{};
	}
}
