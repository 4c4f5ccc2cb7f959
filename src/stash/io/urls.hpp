#ifndef STASH_IO_URLS_HPP
#define STASH_IO_URLS_HPP

#include <stash/core/exception.hpp>

namespace stash {

// Normalize a URL for use as a cache key.
//
// The URL is parsed and rendered back into its canonical text form, and any
// fragment is removed, since fragments are only meaningful to the client and
// don't affect what the server sends back. Thus, "http://example.com/#top"
// and "http://example.com/" normalize to the same URL.
//
string
normalize_url(string const& url);

// If a URL can't be parsed, this exception is thrown.
// It also provides internal_error_message_info.
STASH_DEFINE_EXCEPTION(invalid_url)
STASH_DEFINE_ERROR_INFO(string, url_text)

} // namespace stash

#endif
