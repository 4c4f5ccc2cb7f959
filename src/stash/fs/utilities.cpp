#include <stash/fs/utilities.hpp>

#include <system_error>

namespace stash {

void
reset_directory(file_path const& dir)
{
    if (exists(dir))
        remove_all(dir);
    create_directories(dir);
}

void
create_directories_if_needed(file_path const& dir)
{
    std::error_code error;
    std::filesystem::create_directories(dir, error);
    if (error)
    {
        STASH_THROW(
            directory_creation_failure()
            << directory_path_info(dir)
            << internal_error_message_info(error.message()));
    }
    // create_directories() reports success if something that isn't a
    // directory is already in the way.
    if (!is_directory(dir))
    {
        STASH_THROW(
            directory_creation_failure()
            << directory_path_info(dir)
            << internal_error_message_info(
                   "path exists but isn't a directory"));
    }
}

} // namespace stash
