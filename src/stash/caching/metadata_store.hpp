#ifndef STASH_CACHING_METADATA_STORE_HPP
#define STASH_CACHING_METADATA_STORE_HPP

#include <chrono>
#include <iosfwd>
#include <memory>

#include <stash/core/exception.hpp>

namespace stash {

// The metadata store is the durable index of the cache. It maps each
// (normalized) URL to a cache_record describing where the body of the cached
// response lives and what the server told us about it.

// The metadata store is implemented as an SQLite database with a single table
// keyed by URL. All writes go through transactions, so other connections to
// the database see a record only once its transaction is committed.

struct cache_record
{
    // the path to the cached response body, relative to the cache root
    // (with forward slashes)
    string path;

    // the value of the Last-Modified header in the original response
    optional<string> last_modified;

    // the value of the ETag header in the original response
    optional<string> etag;

    // the value of the Expires header in the original response
    optional<string> expires;
};

bool
operator==(cache_record const& a, cache_record const& b);
bool
operator!=(cache_record const& a, cache_record const& b);

std::ostream&
operator<<(std::ostream& s, cache_record const& record);

// This exception indicates that a metadata store couldn't be opened or
// initialized.
STASH_DEFINE_EXCEPTION(metadata_store_init_failure)
// This provides the location of the metadata store.
STASH_DEFINE_ERROR_INFO(file_path, metadata_store_path)
// This exception also provides internal_error_message_info.

// This exception indicates a failure in the operation of the metadata store.
// It also provides metadata_store_path_info and internal_error_message_info.
STASH_DEFINE_EXCEPTION(metadata_store_failure)

// This exception indicates that a record was found for a URL but it can't be
// trusted, either because a required column holds the wrong type of value or
// because the content path doesn't stay within the cache.
STASH_DEFINE_EXCEPTION(corrupt_cache_record)
STASH_DEFINE_ERROR_INFO(string, cached_url)
STASH_DEFINE_ERROR_INFO(string, column_name)

// This exception indicates that there's no record for a URL.
// It also provides cached_url_info.
STASH_DEFINE_EXCEPTION(url_not_in_cache)

struct metadata_store_impl;

// A metadata_transaction represents a write to the metadata store that hasn't
// been committed yet. If it's destroyed without being committed, the write is
// rolled back, so the store is left exactly as it was before the write was
// begun.
//
// A transaction must not outlive the store that created it.
//
struct metadata_transaction : noncopyable
{
    metadata_transaction(metadata_transaction&& other);

    ~metadata_transaction();

    // Make the write permanent.
    // If the commit fails, the transaction is rolled back and the commit
    // failure is thrown (as metadata_store_failure).
    void
    commit();

 private:
    friend struct metadata_store;

    metadata_transaction(metadata_store_impl& store);

    metadata_store_impl* store_;
    bool finished_ = false;
};

struct metadata_store : noncopyable
{
    // Open the metadata store at :location, creating it (and its schema) if
    // necessary.
    //
    // The special location ":memory:" creates a store that lives only as long
    // as this object.
    //
    // Other locations are canonicalized, which requires that the parent
    // directory exists.
    //
    // While another connection holds a conflicting lock on the database,
    // operations wait up to ten seconds for it to be released before failing.
    //
    metadata_store(file_path const& location);

    // Open the metadata store at :location, waiting up to :busy_timeout for
    // locks held by other connections.
    metadata_store(
        file_path const& location, std::chrono::milliseconds busy_timeout);

    ~metadata_store();

    // Get the (canonical) location of the store.
    file_path const&
    location() const;

    // Look up the record for a URL.
    //
    // The fragment of the URL is ignored.
    //
    // If there's no record for the URL, this returns none.
    //
    // If the record's path isn't stored as text or isn't a relative path that
    // stays within the cache (i.e., it's empty, absolute, or has a ".."
    // component), corrupt_cache_record is thrown. Other columns with
    // unexpected types are treated as absent.
    //
    optional<cache_record>
    find(string const& url);

    // This is the same as find() but throws url_not_in_cache if there's no
    // record for the URL.
    cache_record
    look_up(string const& url);

    // Begin writing the record for a URL, replacing any existing record.
    //
    // The fragment of the URL is ignored.
    //
    // Lookups through this store see the new record immediately. Other
    // stores and connections on the same database don't see it until the
    // returned transaction is committed, and never see it if the transaction
    // is rolled back instead. Only one transaction can be pending at a time.
    //
    [[nodiscard]] metadata_transaction
    begin_write(string const& url, cache_record const& record);

 private:
    std::unique_ptr<metadata_store_impl> impl_;
};

// Two stores are equal if they refer to the same location.
bool
operator==(metadata_store const& a, metadata_store const& b);
bool
operator!=(metadata_store const& a, metadata_store const& b);

std::ostream&
operator<<(std::ostream& s, metadata_store const& store);

} // namespace stash

#endif
