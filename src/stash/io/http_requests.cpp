#include <stash/io/http_requests.hpp>

#include <exception>
#include <ostream>

#include <boost/algorithm/string.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <curl/curl.h>

#include <stash/core/logging.hpp>
#include <stash/fs/file_io.hpp>

namespace stash {

bool
http_header_name_less::operator()(string const& a, string const& b) const
{
    return boost::algorithm::ilexicographical_compare(a, b);
}

optional<string>
get_header(http_header_list const& headers, string const& name)
{
    auto header = headers.find(name);
    return header != headers.end() ? some(header->second) : none;
}

bool
operator==(http_request const& a, http_request const& b)
{
    return a.url == b.url && a.headers == b.headers;
}
bool
operator!=(http_request const& a, http_request const& b)
{
    return !(a == b);
}

static void
write_headers(std::ostream& s, http_header_list const& headers)
{
    for (auto const& header : headers)
        s << "\n  " << header.first << ": " << header.second;
}

// Redact an HTTP request so that it's suitable for logging.
static http_request
redact_request(http_request request)
{
    auto authorization_header = request.headers.find("Authorization");
    if (authorization_header != request.headers.end())
        authorization_header->second = "[redacted]";
    return request;
}

std::ostream&
operator<<(std::ostream& s, http_request const& request)
{
    auto redacted = redact_request(request);
    s << "GET " << redacted.url;
    write_headers(s, redacted.headers);
    return s;
}

bool
operator==(http_response const& a, http_response const& b)
{
    return a.status_code == b.status_code && a.headers == b.headers
           && a.body == b.body;
}
bool
operator!=(http_response const& a, http_response const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, http_response const& response)
{
    s << "HTTP " << response.status_code;
    write_headers(s, response.headers);
    s << "\n  (" << response.body.size() << " bytes of body)";
    return s;
}

http_response
make_http_response(int status_code, http_header_list headers, string body)
{
    http_response response;
    response.status_code = status_code;
    response.headers = std::move(headers);
    response.body = std::move(body);
    return response;
}

http_response
make_http_200_response(string body)
{
    return make_http_response(200, http_header_list(), std::move(body));
}

void
check_http_status(http_request const& request, http_response const& response)
{
    if (is_http_error_status(response.status_code))
    {
        STASH_THROW(
            bad_http_status_code()
            << attempted_http_request_info(redact_request(request))
            << http_response_info(response));
    }
}

http_request_system::http_request_system(optional<file_path> cacert_path)
    : cacert_path_(std::move(cacert_path))
{
    if (curl_global_init(CURL_GLOBAL_ALL))
    {
        STASH_THROW(http_request_system_error());
    }
}
http_request_system::~http_request_system()
{
    curl_global_cleanup();
}

struct http_connection_impl
{
    CURL* curl = nullptr;
    optional<file_path> cacert_path;
};

static void
reset_curl_connection(http_connection_impl& connection)
{
    CURL* curl = connection.curl;
    curl_easy_reset(curl);

    // Allow requests to be redirected.
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    // Tell CURL to accept and decode gzipped responses.
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip");
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 1L);

    // Enable SSL verification.
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    if (connection.cacert_path)
    {
        auto path = connection.cacert_path->string();
        curl_easy_setopt(curl, CURLOPT_CAINFO, path.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Don't wait forever for unreachable servers.
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
}

http_connection::http_connection(http_request_system& system)
    : impl_(new http_connection_impl)
{
    CURL* curl = curl_easy_init();
    if (!curl)
    {
        STASH_THROW(http_request_system_error());
    }
    impl_->curl = curl;

    auto const& cacert_path = system.get_cacert_path();
    if (cacert_path)
    {
        // Confirm that the file actually exists and can be opened.
        // (Curl will silently ignore it if it can't.)
        std::ifstream in;
        open_file(in, *cacert_path, std::ios::in | std::ios::binary);
    }
    impl_->cacert_path = cacert_path;
}
http_connection::~http_connection()
{
    if (impl_)
        curl_easy_cleanup(impl_->curl);
}

// receiving state for the body of a response
struct body_receiver
{
    CURL* curl;
    http_header_list const* headers;
    http_body_sink* sink;
    bool begun = false;
    // Exceptions can't cross CURL's C callbacks, so one thrown by the sink is
    // held here and rethrown once CURL returns.
    std::exception_ptr error;
};

static int
get_response_code(CURL* curl)
{
    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    return boost::numeric_cast<int>(status_code);
}

static void
begin_body(body_receiver& receiver)
{
    receiver.begun = true;
    receiver.sink->begin(get_response_code(receiver.curl), *receiver.headers);
}

static size_t
receive_http_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto& receiver = *reinterpret_cast<body_receiver*>(userdata);
    size_t n_bytes = size * nmemb;
    try
    {
        if (!receiver.begun)
            begin_body(receiver);
        receiver.sink->write(ptr, n_bytes);
    }
    catch (...)
    {
        receiver.error = std::current_exception();
        // Returning a short count tells CURL to abort the transfer.
        return 0;
    }
    return n_bytes;
}

static size_t
record_http_header(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto& headers = *reinterpret_cast<http_header_list*>(userdata);
    size_t n_bytes = size * nmemb;
    string header_line(ptr, n_bytes);

    // When redirects are followed, CURL reports the headers of every response
    // along the way. Each one starts with a status line, so only the headers
    // of the final response survive.
    if (boost::algorithm::starts_with(header_line, "HTTP/"))
    {
        headers.clear();
        return n_bytes;
    }

    auto index = header_line.find(':', 0);
    if (index != string::npos)
    {
        headers[boost::algorithm::trim_copy(header_line.substr(0, index))]
            = boost::algorithm::trim_copy(header_line.substr(index + 1));
    }
    return n_bytes;
}

struct scoped_curl_slist
{
    ~scoped_curl_slist()
    {
        curl_slist_free_all(list);
    }
    curl_slist* list = nullptr;
};

http_response
http_connection::stream_request(
    http_request const& request, http_body_sink& sink)
{
    STASH_LOG_CALL(<< STASH_LOG_ARG(request))

    CURL* curl = impl_->curl;
    reset_curl_connection(*impl_);

    // Set the headers for the request.
    scoped_curl_slist curl_headers;
    for (auto const& header : request.headers)
    {
        auto header_string = header.first + ": " + header.second;
        curl_headers.list
            = curl_slist_append(curl_headers.list, header_string.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers.list);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    // Set up for receiving the response headers.
    http_header_list response_headers;
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, record_http_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);

    // Set up for passing the response body on to the sink.
    body_receiver receiver{curl, &response_headers, &sink};
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, receive_http_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &receiver);

    // Perform the request.
    CURLcode result = curl_easy_perform(curl);

    // A failure inside the sink takes precedence over the write error that
    // CURL reports because of it.
    if (receiver.error)
        std::rethrow_exception(receiver.error);

    // Check for low-level CURL errors.
    if (result != CURLE_OK)
    {
        STASH_THROW(
            http_request_failure()
            << attempted_http_request_info(redact_request(request))
            << internal_error_message_info(curl_easy_strerror(result)));
    }

    // The sink hasn't heard about responses without a body yet.
    if (!receiver.begun)
        begin_body(receiver);

    http_response response;
    response.headers = std::move(response_headers);
    response.status_code = get_response_code(curl);

    get_logger()->debug("GET {} -> {}", request.url, response.status_code);

    return response;
}

namespace {

// collects the body of a response into memory
struct string_body_sink : http_body_sink
{
    void
    begin(int, http_header_list const&) override
    {
    }

    void
    write(char const* data, std::size_t size) override
    {
        body.append(data, size);
    }

    string body;
};

} // namespace

http_response
http_connection_interface::perform_request(http_request const& request)
{
    string_body_sink sink;
    auto response = stream_request(request, sink);
    response.body = std::move(sink.body);
    return response;
}

} // namespace stash
