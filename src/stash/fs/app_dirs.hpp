#ifndef STASH_FS_APP_DIRS_HPP
#define STASH_FS_APP_DIRS_HPP

#include <stash/core/type_definitions.hpp>

// This file provides utilities for resolving directory locations according to
// the conventions of the OS.
//
// For Windows, it uses the non-roaming user data directory (LOCALAPPDATA).
// For other systems, it uses the XDG standards.

namespace stash {

// Get the directory that should be used for user-specific caching.
// If the directory doesn't already exist, it is created.
// (directory_creation_failure is thrown if that fails.)
file_path
get_user_cache_dir(optional<string> const& author_name, string const& app_name);

} // namespace stash

#endif
