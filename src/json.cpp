#include "toggl/json.hpp"

#include <stdexcept>

namespace toggl {

std::string encode_json(const JsonValue& value) {
    return value.serialize();
}

bool decode_json(const std::string& text, JsonValue& out, std::string* err) {
    JsonValue parsed;
    std::string parse_err;
    try {
        parse_err = picojson::parse(parsed, text);
    } catch (const std::overflow_error& e) {
        /* picojson throws on numbers outside the range of double */
        parse_err = e.what();
        if (parse_err.empty()) parse_err = "number out of range";
    }
    if (!parse_err.empty()) {
        if (err) *err = parse_err;
        return false;
    }
    out = parsed;
    return true;
}

} /* namespace toggl */
