#ifndef STASH_IO_MOCK_HTTP_HPP
#define STASH_IO_MOCK_HTTP_HPP

#include <vector>

#include <stash/io/http_requests.hpp>

// This file provides a scripted stand-in for a real HTTP connection, so that
// the cache can be tested without a network.

namespace stash {

// One expected request and what happens when it's made.
// If :response is none, the server is treated as unreachable, and the request
// fails with http_request_failure.
struct mock_http_exchange
{
    http_request request;
    optional<http_response> response;
};

typedef std::vector<mock_http_exchange> mock_http_script;

// A mock_http_session holds the exchanges that are still expected.
// Each exchange is consumed when its request is made.
struct mock_http_session
{
    // Replace whatever remains of the current script.
    void
    set_script(mock_http_script script);

    // Has every exchange in the script been consumed?
    bool
    is_complete() const;

    // Have the requests so far been made in the order the script lists them?
    bool
    is_in_order() const;

 private:
    friend struct mock_http_connection;

    mock_http_script remaining_;
    bool in_order_ = true;
};

// A connection whose requests are answered from a mock_http_session.
// A request that isn't in the remaining script is an internal_check_failed.
// The scripted body is passed to the sink in a single write.
struct mock_http_connection : http_connection_interface
{
    mock_http_connection(mock_http_session& session) : session_(session)
    {
    }

    http_response
    stream_request(http_request const& request, http_body_sink& sink) override;

 private:
    mock_http_session& session_;
};

} // namespace stash

#endif
