#ifndef STASH_CACHING_HTTP_CACHE_HPP
#define STASH_CACHING_HTTP_CACHE_HPP

#include <fstream>

#include <stash/caching/metadata_store.hpp>
#include <stash/io/http_requests.hpp>

namespace stash {

// An HTTP cache keeps local copies of resources retrieved over HTTP so that
// they only have to be downloaded again when they change (or when they can't
// be checked for changes).

// The cache lives in a single directory (the cache root), which holds the
// metadata store (cache.db) and a content/ subdirectory holding the response
// bodies. Everything in the root is derived from the network, so the root can
// be deleted at any time (as long as no cache is using it).

// Multiple caches (in the same process or not) can share a root. The metadata
// store's transactions keep the index consistent, but concurrent fetches of
// the same URL aren't coordinated, so each may download it (and the last one
// to finish wins).

struct http_cache_config
{
    // the cache root - If this is omitted, a per-user cache directory is used.
    optional<file_path> directory;
};

struct http_cache : noncopyable
{
    // Open the cache described by :config, creating it if necessary.
    // Requests go through :connection, which must outlive the cache.
    http_cache(
        http_cache_config const& config,
        http_connection_interface& connection);

    // Get the root directory of the cache.
    file_path const&
    root() const
    {
        return root_;
    }

    // Get the metadata store for the cache.
    metadata_store&
    store()
    {
        return store_;
    }
    metadata_store const&
    store() const
    {
        return store_;
    }

    // Get the content of a URL, either from the cache or from the server.
    //
    // The fragment of the URL is ignored.
    //
    // If the URL is cached, the server is asked whether the cached content is
    // still current, and if it isn't, the new content is downloaded. If the
    // server can't be reached (or responds with an error), the cached content
    // is returned anyway.
    //
    // If the URL isn't cached, it's downloaded, and any failure to do so is
    // thrown.
    //
    // The returned stream is open (in binary mode) at the start of the
    // content.
    //
    std::ifstream
    fetch(string const& url);

 private:
    file_path root_;
    metadata_store store_;
    http_connection_interface& connection_;
};

// Two caches are equal if they use the same metadata store.
bool
operator==(http_cache const& a, http_cache const& b);
bool
operator!=(http_cache const& a, http_cache const& b);

} // namespace stash

#endif
