#include <stash/fs/app_dirs.hpp>

#include <stash/fs/utilities.hpp>
#include <stash/utilities/environment.hpp>
#include <stash/utilities/testing.hpp>

using namespace stash;

#ifdef _WIN32

TEST_CASE("Windows app directories", "[fs][app_dirs]")
{
    // The result depends on the user's profile, so this only checks that
    // something reasonable comes back.
    auto dir = get_user_cache_dir(none, "stash_app_dirs_test_case_app");
    REQUIRE(dir.is_absolute());
    REQUIRE(is_directory(dir));
}

#else

TEST_CASE("XDG cache directory", "[fs][app_dirs]")
{
    auto author = some(string("not_used_here"));
    auto app = string("stash_xdg_test_case_app");

    // Keep everything we're doing local to the test directory.
    auto cwd = std::filesystem::current_path();
    auto home_dir = cwd / "xdg_home";
    reset_directory(home_dir);

    scoped_environment_variable home("HOME", "");
    scoped_environment_variable cache_home("XDG_CACHE_HOME", "");

    // If neither variable is set, there's nowhere to put the cache.
    REQUIRE_THROWS(get_user_cache_dir(author, app));

    // If only HOME is set, the result should be based on that.
    set_environment_variable("HOME", home_dir.string());
    auto default_cache_dir = home_dir / ".cache" / app;
    REQUIRE(get_user_cache_dir(author, app) == default_cache_dir);
    REQUIRE(is_directory(default_cache_dir));
    reset_directory(home_dir);

    // Relative paths aren't used.
    set_environment_variable("XDG_CACHE_HOME", "abc/def");
    REQUIRE(get_user_cache_dir(author, app) == default_cache_dir);

    // A custom (absolute) directory is used.
    auto custom_cache_dir = cwd / "xdg_cache";
    reset_directory(custom_cache_dir);
    set_environment_variable("XDG_CACHE_HOME", custom_cache_dir.string());
    REQUIRE(get_user_cache_dir(author, app) == custom_cache_dir / app);
    REQUIRE(is_directory(custom_cache_dir / app));
}

#endif
