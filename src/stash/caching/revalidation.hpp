#ifndef STASH_CACHING_REVALIDATION_HPP
#define STASH_CACHING_REVALIDATION_HPP

#include <stash/caching/metadata_store.hpp>
#include <stash/io/http_requests.hpp>

namespace stash {

// This file implements the decision of whether cached content for a URL can
// be served as-is, must be replaced with a fresh copy from the server, or
// should be served anyway because the server can't tell us otherwise.
//
// The rules are as follows:
//
// - If there's no usable record for the URL, the content is fetched. Any
//   failure to fetch it is an error, since there's nothing to fall back on.
//
// - If there is a record, a conditional GET is sent using whatever validators
//   were recorded (Last-Modified and/or ETag).
//   * 304 Not Modified means the cached content is current.
//   * Any other successful status means the response carries new content,
//     which replaces the old.
//   * An error status or a failure to reach the server means the cached
//     content is served as-is (with a warning).
//
// New content is streamed to its own file as it arrives. The file is
// completely written and closed before the metadata pointing to it is
// committed, so an interruption can never leave a record pointing at a
// partial file. Files that don't end up recorded are removed.

// the outcome of resolving a URL through the cache
struct resolved_content
{
    // the absolute path of the file holding the content
    file_path path;
    // true iff the content was freshly downloaded (rather than served from
    // the existing cache contents)
    bool fetched = false;
};

// Construct the conditional request that checks whether the content recorded
// in :record is still current.
// Validators that weren't recorded are simply omitted.
http_request
make_revalidation_request(string const& url, cache_record const& record);

// Construct the record for content that's stored at :relative_path and came
// from :response.
cache_record
make_cache_record(string const& relative_path, http_response const& response);

// Resolve a (normalized) URL to content within the cache rooted at :root.
resolved_content
resolve_cached_url(
    file_path const& root,
    metadata_store& store,
    http_connection_interface& connection,
    string const& url);

} // namespace stash

#endif
