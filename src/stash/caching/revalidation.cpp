#include <stash/caching/revalidation.hpp>

#include <filesystem>
#include <system_error>

#include <stash/caching/content_store.hpp>
#include <stash/core/logging.hpp>

namespace stash {

http_request
make_revalidation_request(string const& url, cache_record const& record)
{
    http_header_list headers;
    if (record.last_modified)
        headers["If-Modified-Since"] = *record.last_modified;
    if (record.etag)
        headers["If-None-Match"] = *record.etag;
    return make_get_request(url, std::move(headers));
}

cache_record
make_cache_record(string const& relative_path, http_response const& response)
{
    cache_record record;
    record.path = relative_path;
    record.last_modified = get_header(response.headers, "Last-Modified");
    record.etag = get_header(response.headers, "ETag");
    record.expires = get_header(response.headers, "Expires");
    return record;
}

static resolved_content
serve_existing(file_path const& root, cache_record const& record)
{
    resolved_content content;
    content.path = root / file_path(record.path);
    content.fetched = false;
    return content;
}

namespace {

// content_sink streams a response body into a new content file.
// Only bodies that will become the cached content are written to disk. When
// there's no cached content to fall back on, an error body is kept in memory
// for reporting. Otherwise, bodies that aren't written are dropped.
// Unless the content is kept, the file is removed when the sink goes away.
struct content_sink : http_body_sink
{
    content_sink(file_path content_dir, bool revalidating)
        : content_dir_(std::move(content_dir)), revalidating_(revalidating)
    {
    }

    ~content_sink()
    {
        if (!file_ || kept_)
            return;
        file_->handle.reset();
        std::error_code error;
        std::filesystem::remove(file_->path, error);
        if (error)
        {
            get_logger()->warn(
                "could not remove unused content file {}: {}",
                file_->path.string(),
                error.message());
        }
    }

    void
    begin(int status_code, http_header_list const&) override
    {
        accepted_ = !is_http_error_status(status_code)
                    && !(revalidating_ && status_code == 304);
        if (accepted_)
            file_.emplace(create_new_content_file(content_dir_));
    }

    void
    write(char const* data, std::size_t size) override
    {
        if (file_)
            append_content(*file_, data, size);
        else if (!revalidating_)
            rejected_body_.append(data, size);
    }

    // Is the body being written to a content file?
    bool
    accepted() const
    {
        return accepted_;
    }

    string&
    rejected_body()
    {
        return rejected_body_;
    }

    // Close the content file once the whole body has been received.
    content_file const&
    finish()
    {
        if (!file_)
        {
            STASH_THROW(
                internal_check_failed() << internal_error_message_info(
                    "no content file to finish"));
        }
        finish_content(*file_);
        return *file_;
    }

    // Keep the content file once it's been recorded in the metadata.
    void
    keep()
    {
        kept_ = true;
    }

 private:
    file_path content_dir_;
    bool revalidating_;
    bool accepted_ = false;
    optional<content_file> file_;
    bool kept_ = false;
    string rejected_body_;
};

} // namespace

// Record the content that :sink has received from :response as the content
// for :url. The file is completely written and closed before the metadata
// that points to it is committed.
static resolved_content
store_fresh_content(
    file_path const& root,
    metadata_store& store,
    string const& url,
    content_sink& sink,
    http_response const& response)
{
    auto const& file = sink.finish();

    auto record
        = make_cache_record(get_root_relative_path(root, file.path), response);
    auto transaction = store.begin_write(url, record);
    transaction.commit();
    sink.keep();

    resolved_content content;
    content.path = file.path;
    content.fetched = true;
    return content;
}

resolved_content
resolve_cached_url(
    file_path const& root,
    metadata_store& store,
    http_connection_interface& connection,
    string const& url)
{
    optional<cache_record> existing;
    try
    {
        existing = store.find(url);
    }
    catch (corrupt_cache_record& e)
    {
        auto const* column = get_error_info<column_name_info>(e);
        get_logger()->warn(
            "record for {} is corrupt ({}); fetching it again",
            url,
            column ? *column : string("unknown column"));
    }

    if (!existing)
    {
        get_logger()->debug("{} isn't cached; fetching it", url);
        auto request = make_get_request(url, http_header_list());
        content_sink sink(root / "content", false);
        auto response = connection.stream_request(request, sink);
        if (!sink.accepted())
        {
            response.body = std::move(sink.rejected_body());
            check_http_status(request, response);
        }
        return store_fresh_content(root, store, url, sink, response);
    }

    auto request = make_revalidation_request(url, *existing);
    content_sink sink(root / "content", true);
    http_response response;
    try
    {
        response = connection.stream_request(request, sink);
    }
    catch (http_request_failure& e)
    {
        get_logger()->warn(
            "could not revalidate {} ({}); using cached content",
            url,
            get_error_message(e));
        return serve_existing(root, *existing);
    }

    if (is_http_error_status(response.status_code))
    {
        get_logger()->warn(
            "server returned {} while revalidating {}; using cached content",
            response.status_code,
            url);
        return serve_existing(root, *existing);
    }

    if (response.status_code == 304)
    {
        get_logger()->debug("{} not modified; using cached content", url);
        return serve_existing(root, *existing);
    }

    get_logger()->debug(
        "{} changed (status {}); replacing cached content",
        url,
        response.status_code);
    return store_fresh_content(root, store, url, sink, response);
}

} // namespace stash
