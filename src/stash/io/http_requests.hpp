#ifndef STASH_IO_HTTP_REQUESTS_HPP
#define STASH_IO_HTTP_REQUESTS_HPP

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>

#include <stash/core/exception.hpp>

// This file defines a low-level facility for doing HTTP requests.

namespace stash {

// Header field names are case-insensitive, so header lists compare names
// without regard to case.
struct http_header_name_less
{
    bool
    operator()(string const& a, string const& b) const;
};

// HTTP headers are specified as a mapping from field names to values.
typedef std::map<string, string, http_header_name_less> http_header_list;

// Get the value of a header, if it's present.
optional<string>
get_header(http_header_list const& headers, string const& name);

// All requests are GETs.
struct http_request
{
    string url;
    http_header_list headers;
};

bool
operator==(http_request const& a, http_request const& b);
bool
operator!=(http_request const& a, http_request const& b);

std::ostream&
operator<<(std::ostream& s, http_request const& request);

// Construct a GET request (in a convenient way).
inline http_request
make_get_request(string url, http_header_list headers)
{
    return http_request{std::move(url), std::move(headers)};
}

struct http_response
{
    int status_code = 0;
    http_header_list headers;
    string body;
};

bool
operator==(http_response const& a, http_response const& b);
bool
operator!=(http_response const& a, http_response const& b);

std::ostream&
operator<<(std::ostream& s, http_response const& response);

// Make an HTTP response with the given status code, headers and body.
http_response
make_http_response(
    int status_code, http_header_list headers = {}, string body = string());

// Make a successful (200) HTTP response with the given body.
http_response
make_http_200_response(string body);

// This exception indicates a general failure in the HTTP request
// system (e.g., a failure to initialize).
STASH_DEFINE_EXCEPTION(http_request_system_error)

// This exception indicates that a failure occurred in the processing
// of a HTTP request that precluded getting a response from the server
// (e.g., the server couldn't be reached).
STASH_DEFINE_EXCEPTION(http_request_failure)
// This exception also provides internal_error_message_info.
STASH_DEFINE_ERROR_INFO(http_request, attempted_http_request)

// This exception indicates that an HTTP request was resolved but resulted in
// an error status code (400-599). The full response is included.
STASH_DEFINE_EXCEPTION(bad_http_status_code)
// This exception also provides attempted_http_request_info.
STASH_DEFINE_ERROR_INFO(http_response, http_response)

// Does :status_code denote an HTTP error (client or server)?
inline bool
is_http_error_status(int status_code)
{
    return status_code >= 400 && status_code <= 599;
}

// Check the status code of a response, throwing bad_http_status_code if it's
// an error status.
void
check_http_status(http_request const& request, http_response const& response);

// http_request_system provides global initialization and shutdown of the HTTP
// request system. Exactly one of these objects must be instantiated by the
// application, and its scope must dominate the scope of all http_connection
// objects.
//
// :cacert_path optionally specifies a CA certificate bundle to use in place
// of the system's.
//
struct http_request_system : noncopyable
{
    http_request_system(optional<file_path> cacert_path = none);
    ~http_request_system();

    optional<file_path> const&
    get_cacert_path() const
    {
        return cacert_path_;
    }

 private:
    optional<file_path> cacert_path_;
};

// http_body_sink receives the body of a response as it arrives.
// begin() is called exactly once, before any calls to write(), as soon as the
// status and headers of the final response are known. (It's still called
// when the body is empty.) Exceptions thrown by either call abort the request
// and propagate out of stream_request().
struct http_body_sink
{
    virtual ~http_body_sink()
    {
    }

    virtual void
    begin(int status_code, http_header_list const& headers) = 0;

    virtual void
    write(char const* data, std::size_t size) = 0;
};

// http_connection_interface is the capability to perform HTTP requests.
// Responses are returned regardless of their status code. Only failures to
// obtain a response at all are reported via http_request_failure.
struct http_connection_interface
{
    virtual ~http_connection_interface()
    {
    }

    // Perform an HTTP request, passing the response body to :sink as it
    // arrives. The returned response carries the status code and headers but
    // no body.
    virtual http_response
    stream_request(http_request const& request, http_body_sink& sink) = 0;

    // Perform an HTTP request and return the whole response, body included.
    http_response
    perform_request(http_request const& request);
};

struct http_connection_impl;

// http_connection provides a network connection over which HTTP requests can
// be made.
struct http_connection : http_connection_interface, noncopyable
{
    http_connection(http_request_system& system);
    ~http_connection();

    http_response
    stream_request(http_request const& request, http_body_sink& sink) override;

 private:
    std::unique_ptr<http_connection_impl> impl_;
};

} // namespace stash

#endif
