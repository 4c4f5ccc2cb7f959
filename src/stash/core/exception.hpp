#ifndef STASH_CORE_EXCEPTION_HPP
#define STASH_CORE_EXCEPTION_HPP

#include <stash/core/type_definitions.hpp>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

namespace stash {

// All exceptions thrown by stash are Boost.Exception objects, so whatever
// context is known at the throw site (the URL, the file, the underlying
// library's message, etc.) travels with them as error_info.

// Define an exception type.
// Its what() string includes all the error_info attached to it.
#define STASH_DEFINE_EXCEPTION(id)                                            \
    struct id : virtual boost::exception, virtual std::exception              \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

// Define an error_info type named id##_info that holds a T.
#define STASH_DEFINE_ERROR_INFO(T, id)                                        \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

STASH_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

// Throw an exception with the current stack trace attached.
#define STASH_THROW(x)                                                        \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << stash::stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// the message supplied by a lower-level library (SQLite, libcurl, the OS,
// etc.) when it reports a failure
STASH_DEFINE_ERROR_INFO(string, internal_error_message)

// Get the internal_error_message_info attached to :e, or a generic
// description if there isn't one.
template<class Exception>
string
get_error_message(Exception const& e)
{
    auto const* message = get_error_info<internal_error_message_info>(e);
    return message ? *message : string("unknown failure");
}

// internal_check_failed is thrown when stash itself is misused or reaches a
// state that it should have made impossible.
STASH_DEFINE_EXCEPTION(internal_check_failed)

// Get error_info that's required to be present.
// If it's absent, missing_error_info is thrown, carrying the diagnostics of
// the original exception.
STASH_DEFINE_EXCEPTION(missing_error_info)
STASH_DEFINE_ERROR_INFO(string, error_info_id)
STASH_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)
template<class ErrorInfo, class Exception>
typename ErrorInfo::error_info::value_type const&
get_required_error_info(Exception const& e)
{
    auto const* info = get_error_info<ErrorInfo>(e);
    if (!info)
    {
        STASH_THROW(
            missing_error_info()
            << error_info_id_info(typeid(ErrorInfo).name())
            << wrapped_exception_diagnostics_info(
                   boost::diagnostic_information(e)));
    }
    return *info;
}

} // namespace stash

#endif
