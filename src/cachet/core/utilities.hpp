#ifndef CACHET_CORE_UTILITIES_HPP
#define CACHET_CORE_UTILITIES_HPP

#include <cachet/core/exception.hpp>

#include <memory>
#include <type_traits>
#include <vector>

#include <boost/lexical_cast.hpp>

namespace cachet {

using boost::lexical_cast;

// CACHET_LAMBDIFY(f) produces a lambda that calls f, which is essentially a
// version of f that can be passed as an argument and still allows normal
// overload resolution.
#define CACHET_LAMBDIFY(f) [](auto&&... args) { return f(args...); }

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
CACHET_DEFINE_EXCEPTION(invalid_enum_value)
CACHET_DEFINE_ERROR_INFO(string, enum_id)
CACHET_DEFINE_ERROR_INFO(int, enum_value)

// If a simple parsing operation fails, this exception can be thrown.
CACHET_DEFINE_EXCEPTION(parsing_error)
CACHET_DEFINE_ERROR_INFO(string, expected_format)
CACHET_DEFINE_ERROR_INFO(string, parsed_text)
CACHET_DEFINE_ERROR_INFO(string, parsing_error)

// Get the value of an environment variable.
string
get_environment_variable(string const& name);
// If the variable isn't set, the following exception is thrown.
CACHET_DEFINE_EXCEPTION(missing_environment_variable)
CACHET_DEFINE_ERROR_INFO(string, variable_name)

// Get the value of an optional environment variable.
// If the variable isn't set, this simply returns none.
optional<string>
get_optional_environment_variable(string const& name);

// Set the value of an environment variable.
// Setting it to an empty string unsets it.
void
set_environment_variable(string const& name, string const& value);

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
CACHET_DEFINE_ERROR_INFO(string, internal_error_message)

// This can be used to flag errors that represent failed checks on conditions
// that should be guaranteed internally.
CACHET_DEFINE_EXCEPTION(internal_check_failed)

// Convert a time point to milliseconds since the epoch and back.
integer
to_epoch_milliseconds(timestamp t);
timestamp
from_epoch_milliseconds(integer ms);

} // namespace cachet

#endif
