#ifndef TOGGL_JSON_HPP
#define TOGGL_JSON_HPP

#include <picojson/picojson.h>

#include <string>

namespace toggl {

/* Convenience typedefs for picojson */
typedef picojson::value  JsonValue;
typedef picojson::object JsonObject;
typedef picojson::array  JsonArray;

/**
 * Serialize a JSON value for use as a request body.
 */
std::string encode_json(const JsonValue& value);

/**
 * Parse text into a JSON value. Never throws.
 *
 * @return false on a parse error, with the reason in *err when err is given.
 */
bool decode_json(const std::string& text, JsonValue& out, std::string* err = NULL);

} // namespace toggl

#endif // TOGGL_JSON_HPP
