#ifndef CACHET_ENCODINGS_JSON_HPP
#define CACHET_ENCODINGS_JSON_HPP

#include <cachet/core/dynamic.hpp>

// JSON - conversion to and from JSON strings
//
// Maps whose keys are all strings are written as JSON objects. Any other map
// is written as a tagged object holding its key/value pairs:
//
//   {"$map": [[key, value], ...]}
//
// A string-keyed map whose only key is "$map" is tagged as well, so it can't
// be mistaken for the encoding of some other map. Arrays are always written
// as JSON arrays, so every value that's written reads back as itself.

namespace cachet {

// the key of the object that wraps a map with non-string keys
extern char const json_map_tag[];

// Parse some JSON text into a dynamic value.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
static inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in (human-readable) JSON format.
string
value_to_json(dynamic const& v);

// Write a value to a string in canonical JSON format: no whitespace and
// object keys in sorted order. Two values that compare equal always produce
// the same canonical text, regardless of how they were constructed, and two
// values that differ never do.
string
value_to_canonical_json(dynamic const& v);

} // namespace cachet

#endif
