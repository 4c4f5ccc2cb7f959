#ifndef STASH_CACHING_CONTENT_STORE_HPP
#define STASH_CACHING_CONTENT_STORE_HPP

#include <cstdio>
#include <memory>

#include <stash/fs/file_io.hpp>
#include <stash/fs/utilities.hpp>

namespace stash {

// The content store is the directory of response bodies within the cache.
// Each body is written to a new file with a randomly generated name, and
// files are never modified once written.

// Generate a random file name of the given length.
// Names are drawn from lowercase letters and digits, leaving out characters
// that are easily confused (0/o, 1/l). Only lowercase letters are used so
// that names stay distinct on case-insensitive filesystems.
string
make_random_file_name(std::size_t length = 20);

struct file_closer
{
    void
    operator()(std::FILE* file) const
    {
        std::fclose(file);
    }
};

typedef std::unique_ptr<std::FILE, file_closer> file_handle;

// a newly created (and still open) content file
struct content_file
{
    file_path path;
    file_handle handle;
    std::size_t bytes_written = 0;
};

// Create a new, empty file with a random name in :content_dir (which is
// created if necessary). The name is guaranteed not to collide with an
// existing file.
content_file
create_new_content_file(file_path const& content_dir);

// If a file can't be created, this exception is thrown.
// It provides file_path_info and internal_error_message_info.
STASH_DEFINE_EXCEPTION(file_creation_failure)

// Append :size bytes of :data to an open content file.
void
append_content(content_file& file, char const* data, std::size_t size);

// Close a content file that's been written. Once this returns, the file is
// completely written.
void
finish_content(content_file& file);

// Write :data to a new content file and close it.
void
write_content(content_file& file, string const& data);

// If a file can't be written, this exception is thrown.
// It provides file_path_info and internal_error_message_info.
STASH_DEFINE_EXCEPTION(file_write_failure)

// Get the path of :path relative to :root, in the form that's recorded in the
// metadata store (i.e., with forward slashes).
string
get_root_relative_path(file_path const& root, file_path const& path);

// If the path isn't inside the root, this exception is thrown.
// It provides file_path_info and directory_path_info (for the root).
STASH_DEFINE_EXCEPTION(path_outside_root)

} // namespace stash

#endif
