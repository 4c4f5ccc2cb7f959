#ifndef STASH_UTILITIES_TESTING_HPP
#define STASH_UTILITIES_TESTING_HPP

#include <catch2/catch.hpp>

#include <stash/core/type_definitions.hpp>

// Catch doesn't know how to print boost::optional values, so teach it.
namespace Catch {

template<class T>
struct StringMaker<boost::optional<T>>
{
    static std::string
    convert(boost::optional<T> const& value)
    {
        return value ? "some(" + StringMaker<T>::convert(*value) + ")"
                     : "none";
    }
};

} // namespace Catch

#endif
