#include <stash/utilities/environment.hpp>

#include <cstdlib>

namespace stash {

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    if (!value || *value == '\0')
        return none;
    return some(string(value));
}

string
get_environment_variable(string const& name)
{
    if (auto value = get_optional_environment_variable(name))
        return *value;
    STASH_THROW(missing_environment_variable() << variable_name_info(name));
}

void
set_environment_variable(string const& name, string const& value)
{
#ifdef _WIN32
    // An empty value removes the variable on Windows.
    _putenv_s(name.c_str(), value.c_str());
#else
    if (value.empty())
        unsetenv(name.c_str());
    else
        setenv(name.c_str(), value.c_str(), 1);
#endif
}

scoped_environment_variable::scoped_environment_variable(
    string name, string const& value)
    : name_(std::move(name)),
      original_value_(get_optional_environment_variable(name_))
{
    set_environment_variable(name_, value);
}

scoped_environment_variable::~scoped_environment_variable()
{
    set_environment_variable(
        name_, original_value_ ? *original_value_ : string());
}

} // namespace stash
