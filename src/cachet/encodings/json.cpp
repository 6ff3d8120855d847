#include <cachet/encodings/json.hpp>

#include <mutex>

#include <boost/numeric/conversion/cast.hpp>

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <cachet/core/utilities.hpp>

namespace cachet {

char const json_map_tag[] = "$map";

namespace {

// READING

dynamic
read_json(simdjson::dom::element const& json);

// If :object is a tagged map, get the array of its pairs.
optional<simdjson::dom::array>
tagged_pairs(simdjson::dom::object const& object)
{
    if (object.size() != 1)
        return none;
    simdjson::dom::array pairs;
    if (object.at_key(json_map_tag).get(pairs) != simdjson::SUCCESS)
        return none;
    for (auto const& pair : pairs)
    {
        if (pair.type() != simdjson::dom::element_type::ARRAY
            || simdjson::dom::array(pair).size() != 2)
        {
            return none;
        }
    }
    return pairs;
}

dynamic
read_json_object(simdjson::dom::object const& object)
{
    dynamic_map map;
    if (auto pairs = tagged_pairs(object))
    {
        for (auto const& pair : *pairs)
            map[read_json(pair.at(0))] = read_json(pair.at(1));
    }
    else
    {
        for (auto const& member : object)
            map[string(member.key)] = read_json(member.value);
    }
    return map;
}

dynamic
read_json(simdjson::dom::element const& json)
{
    switch (json.type())
    {
        case simdjson::dom::element_type::BOOL:
            return bool(json);
        case simdjson::dom::element_type::INT64:
            return boost::numeric_cast<integer>(int64_t(json));
        case simdjson::dom::element_type::UINT64:
            return boost::numeric_cast<integer>(uint64_t(json));
        case simdjson::dom::element_type::DOUBLE:
            return double(json);
        case simdjson::dom::element_type::STRING:
            return string(json.get_string().value());
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array source = json;
            dynamic_array array;
            array.reserve(source.size());
            for (auto const& item : source)
                array.push_back(read_json(item));
            return array;
        }
        case simdjson::dom::element_type::OBJECT:
            return read_json_object(json);
        case simdjson::dom::element_type::NULL_VALUE:
        default:
            return nil;
    }
}

// WRITING

// Can :map be written as a plain JSON object?
bool
is_plain_object(dynamic_map const& map)
{
    for (auto const& [key, value] : map)
    {
        if (key.type() != value_type::STRING)
            return false;
    }
    return !(
        map.size() == 1 && cast<string>(map.begin()->first) == json_map_tag);
}

nlohmann::json
to_json(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::BOOLEAN:
            return cast<bool>(v);
        case value_type::INTEGER:
            return cast<integer>(v);
        case value_type::FLOAT:
            return cast<double>(v);
        case value_type::STRING:
            return cast<string>(v);
        case value_type::ARRAY: {
            auto json = nlohmann::json::array();
            for (auto const& item : cast<dynamic_array>(v))
                json.push_back(to_json(item));
            return json;
        }
        case value_type::MAP: {
            auto const& map = cast<dynamic_map>(v);
            if (is_plain_object(map))
            {
                auto json = nlohmann::json::object();
                for (auto const& [key, value] : map)
                    json[cast<string>(key)] = to_json(value);
                return json;
            }
            auto pairs = nlohmann::json::array();
            for (auto const& [key, value] : map)
            {
                pairs.push_back(
                    nlohmann::json::array({to_json(key), to_json(value)}));
            }
            auto tagged = nlohmann::json::object();
            tagged[json_map_tag] = std::move(pairs);
            return tagged;
        }
        case value_type::NIL:
        default:
            return nullptr;
    }
}

} // namespace

dynamic
parse_json_value(char const* json, size_t length)
{
    // simdjson parsers reuse their buffers, so one is shared (under a lock).
    static simdjson::dom::parser parser;
    static std::mutex mutex;
    std::scoped_lock<std::mutex> lock(mutex);

    simdjson::dom::element document;
    auto error = parser.parse(json, length).get(document);
    if (error)
    {
        CACHET_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info(string(json, length))
                            << parsing_error_info(
                                   simdjson::error_message(error)));
    }
    return read_json(document);
}

string
value_to_json(dynamic const& v)
{
    return to_json(v).dump(4);
}

string
value_to_canonical_json(dynamic const& v)
{
    // nlohmann::json objects keep their keys in a std::map, so a compact
    // dump is already canonical.
    return to_json(v).dump();
}

} // namespace cachet
