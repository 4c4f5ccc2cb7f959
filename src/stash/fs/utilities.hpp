#ifndef STASH_FS_UTILITIES_HPP
#define STASH_FS_UTILITIES_HPP

#include <stash/core/exception.hpp>

namespace stash {

// Remove everything in :dir (if it exists) and recreate it as an empty
// directory.
void
reset_directory(file_path const& dir);

// Create :dir (along with any missing parents) if it doesn't already exist.
void
create_directories_if_needed(file_path const& dir);

// If the above is unable to create the requested directory, this exception is
// thrown.
// It also provides internal_error_message_info.
STASH_DEFINE_EXCEPTION(directory_creation_failure)
STASH_DEFINE_ERROR_INFO(file_path, directory_path)

} // namespace stash

#endif
