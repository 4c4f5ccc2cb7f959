#ifndef STASH_CORE_LOGGING_HPP
#define STASH_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace stash {

// Get the logger that stash writes to.
// If the embedding application has already registered a logger named
// "stash", that's the one that's used. Otherwise, one is created that writes
// to stderr.
std::shared_ptr<spdlog::logger>
get_logger();

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n  " << arg.name << ": " << arg.value;
    return stream;
}

} // namespace detail

// Create a logger for a function call.
#define STASH_LOG_CALL(args)                                                  \
    {                                                                         \
        auto logger = stash::get_logger();                                    \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define STASH_LOG_ARG(arg)                                                    \
    stash::detail::arg_logger<                                                \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace stash

#endif
