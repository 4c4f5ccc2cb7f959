#include <stash/fs/app_dirs.hpp>

#include <stash/fs/utilities.hpp>
#include <stash/utilities/environment.hpp>

namespace stash {

#ifdef _WIN32

file_path static
get_user_cache_home()
{
    return get_environment_variable("LOCALAPPDATA");
}

#else // Unix-based systems

file_path static
get_user_home_dir()
{
    return get_environment_variable("HOME");
}

file_path static
get_user_cache_home()
{
    auto xdg_cache_home = get_optional_environment_variable("XDG_CACHE_HOME");
    if (xdg_cache_home)
    {
        file_path dir = *xdg_cache_home;
        // XDG requires absolute paths.
        if (dir.is_absolute())
            return dir;
    }
    return get_user_home_dir() / ".cache";
}

#endif

file_path
get_user_cache_dir(optional<string> const& author_name, string const& app_name)
{
    auto app_cache_dir = get_user_cache_home();
#ifdef _WIN32
    // Windows conventionally groups application directories by author.
    if (author_name)
        app_cache_dir /= *author_name;
#else
    // XDG has no notion of an author.
    (void) author_name;
#endif
    app_cache_dir /= app_name;
    create_directories_if_needed(app_cache_dir);
    return app_cache_dir;
}

} // namespace stash
