#include <cachet/core/utilities.hpp>

#include <cstdlib>

namespace cachet {

string
get_environment_variable(string const& name)
{
    auto value = get_optional_environment_variable(name);
    if (!value)
    {
        CACHET_THROW(missing_environment_variable() << variable_name_info(name));
    }
    return *value;
}

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    return value && *value != '\0' ? some(string(value)) : none;
}

void
set_environment_variable(string const& name, string const& value)
{
    if (value.empty())
        unsetenv(name.c_str());
    else
        setenv(name.c_str(), value.c_str(), 1);
}

integer
to_epoch_milliseconds(timestamp t)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               t.time_since_epoch())
        .count();
}

timestamp
from_epoch_milliseconds(integer ms)
{
    return timestamp(std::chrono::duration_cast<timestamp::duration>(
        std::chrono::milliseconds(ms)));
}

} // namespace cachet
