#include <stash/io/mock_http.hpp>

#include <algorithm>
#include <sstream>

namespace stash {

void
mock_http_session::set_script(mock_http_script script)
{
    remaining_ = std::move(script);
    in_order_ = true;
}

bool
mock_http_session::is_complete() const
{
    return remaining_.empty();
}

bool
mock_http_session::is_in_order() const
{
    return in_order_;
}

http_response
mock_http_connection::stream_request(
    http_request const& request, http_body_sink& sink)
{
    auto& remaining = session_.remaining_;
    auto match = std::ranges::find(
        remaining, request, &mock_http_exchange::request);
    if (match == remaining.end())
    {
        std::ostringstream message;
        message << "unrecognized mock HTTP request: " << request;
        STASH_THROW(
            internal_check_failed()
            << internal_error_message_info(message.str()));
    }
    if (match != remaining.begin())
        session_.in_order_ = false;

    auto response = std::move(match->response);
    remaining.erase(match);

    if (!response)
    {
        STASH_THROW(
            http_request_failure()
            << attempted_http_request_info(request)
            << internal_error_message_info("mock server unreachable"));
    }

    sink.begin(response->status_code, response->headers);
    if (!response->body.empty())
        sink.write(response->body.data(), response->body.size());
    response->body.clear();
    return std::move(*response);
}

} // namespace stash
