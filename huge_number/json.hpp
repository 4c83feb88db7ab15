#pragma once

#include "huge_number.hpp"

#include <jsoncpp/json/json.h>

#include <string>

// JSON string holding the round-trip text of the value
Json::Value ToJson(const huge_number &value);

// JSON object {"mantissa", "exponent", "denominator"} of the stored fields
Json::Value ToJsonFields(const huge_number &value);

// Accepts either form above or a JSON number, anything else gives NaN
huge_number FromJson(const Json::Value &json);

// Reads a JSON document, NaN when it does not parse
huge_number FromJsonText(const std::string &text);
