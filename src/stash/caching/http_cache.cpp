#include <stash/caching/http_cache.hpp>

#include <stash/caching/revalidation.hpp>
#include <stash/core/logging.hpp>
#include <stash/fs/app_dirs.hpp>
#include <stash/fs/file_io.hpp>
#include <stash/fs/utilities.hpp>
#include <stash/io/urls.hpp>

namespace stash {

static file_path
prepare_cache_root(http_cache_config const& config)
{
    file_path root = config.directory ? *config.directory
                                      : get_user_cache_dir(none, "stash");
    create_directories_if_needed(root);
    return root;
}

http_cache::http_cache(
    http_cache_config const& config, http_connection_interface& connection)
    : root_(prepare_cache_root(config)),
      store_(root_ / "cache.db"),
      connection_(connection)
{
}

std::ifstream
http_cache::fetch(string const& url)
{
    STASH_LOG_CALL(<< STASH_LOG_ARG(url))

    auto normalized_url = normalize_url(url);
    auto content
        = resolve_cached_url(root_, store_, connection_, normalized_url);
    return open_file_for_reading(content.path);
}

bool
operator==(http_cache const& a, http_cache const& b)
{
    return a.store() == b.store();
}
bool
operator!=(http_cache const& a, http_cache const& b)
{
    return !(a == b);
}

} // namespace stash
