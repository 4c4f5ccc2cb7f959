#ifndef STASH_UTILITIES_ENVIRONMENT_HPP
#define STASH_UTILITIES_ENVIRONMENT_HPP

#include <stash/core/exception.hpp>

namespace stash {

// In all of the following, a variable that's set to the empty string is
// treated the same as one that isn't set at all.

// Get the value of an environment variable that's required to be set.
string
get_environment_variable(string const& name);
STASH_DEFINE_EXCEPTION(missing_environment_variable)
STASH_DEFINE_ERROR_INFO(string, variable_name)

// Get the value of an environment variable, or none if it's not set.
optional<string>
get_optional_environment_variable(string const& name);

// Set an environment variable for the whole process.
// Setting it to the empty string unsets it.
void
set_environment_variable(string const& name, string const& value);

// Override an environment variable for the lifetime of this object.
// The original value (or absence) is restored on destruction.
struct scoped_environment_variable : noncopyable
{
    scoped_environment_variable(string name, string const& value);
    ~scoped_environment_variable();

 private:
    string name_;
    optional<string> original_value_;
};

} // namespace stash

#endif
