#include <stash/io/urls.hpp>

#include <memory>

#include <curl/curl.h>

namespace stash {

namespace {

struct curl_url_deleter
{
    void
    operator()(CURLU* handle) const
    {
        curl_url_cleanup(handle);
    }
};

typedef std::unique_ptr<CURLU, curl_url_deleter> curl_url_ptr;

struct curl_string_deleter
{
    void
    operator()(char* s) const
    {
        curl_free(s);
    }
};

typedef std::unique_ptr<char, curl_string_deleter> curl_string_ptr;

void
check_url_code(string const& url, CURLUcode code)
{
    if (code != CURLUE_OK)
    {
        STASH_THROW(
            invalid_url() << url_text_info(url)
                          << internal_error_message_info(
                                 curl_url_strerror(code)));
    }
}

} // namespace

string
normalize_url(string const& url)
{
    curl_url_ptr handle(curl_url());
    if (!handle)
    {
        STASH_THROW(
            invalid_url() << url_text_info(url)
                          << internal_error_message_info(
                                 "failed to allocate URL handle"));
    }

    check_url_code(
        url, curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0));

    // Setting a part to null removes it.
    check_url_code(
        url, curl_url_set(handle.get(), CURLUPART_FRAGMENT, nullptr, 0));

    char* normalized = nullptr;
    check_url_code(
        url, curl_url_get(handle.get(), CURLUPART_URL, &normalized, 0));
    curl_string_ptr owner(normalized);
    return string(normalized);
}

} // namespace stash
