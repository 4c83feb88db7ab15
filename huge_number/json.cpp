#include "json.hpp"

#include <boost/log/trivial.hpp>

#include <memory>

//#define TRACE_JSON	1

#ifndef TRACE_JSON
#define TRACE_JSON	0 // don't test
#endif

using mantissa_t = huge_number::mantissa_t;
using denominator_t = huge_number::denominator_t;



//-ENCODING------------------------------------------------------------------------------------------------------------

Json::Value ToJson(const huge_number &value)
{
	return Json::Value(huge_number::ToString(value, "R"));
}

Json::Value ToJsonFields(const huge_number &value)
{
	Json::Value root(Json::objectValue);

	root["mantissa"] = Json::Int64(value.mantissa());
	root["exponent"] = int(value.exponent());
	root["denominator"] = unsigned(value.denominator());

	return root;
}



//-DECODING------------------------------------------------------------------------------------------------------------

static huge_number fromFields(const Json::Value &root)
{
	const Json::Value
			&mantissa = root["mantissa"],
			&exponent = root["exponent"],
			&denominator = root["denominator"];

	if(!mantissa.isInt64() || !(exponent.isNull() || exponent.isInt()))
		return huge_number::NaN();

	if(!(denominator.isNull() || denominator.isUInt()) || denominator.asUInt() > huge_number::MaxDenominator)
		return huge_number::NaN();

	const mantissa_t numerator = mantissa.asInt64();
	const int scale = exponent.isNull() ? 0 : exponent.asInt();
	const denominator_t divisor = denominator.isNull() ? huge_number::DefaultDenominator : denominator_t(denominator.asUInt());

	// Zero carries its sign in the exponent
	if(!numerator && divisor != huge_number::SentinelDenominator)
		return scale < 0 ? huge_number::NegativeZero() : huge_number::Zero();

	// A zero denominator selects the sentinel of the mantissa sign
	return huge_number(numerator, divisor, scale);
}

huge_number FromJson(const Json::Value &json)
{
	if(json.isString())
		return huge_number::Parse(json.asString());
	if(json.isObject())
		return fromFields(json);
	if(json.isInt64())
		return huge_number(json.asInt64());
	if(json.isUInt64())
		return huge_number(json.asUInt64());
	if(json.isDouble())
		return huge_number(json.asDouble());

	if(TRACE_JSON) BOOST_LOG_TRIVIAL(trace) << "FromJson unsupported value type " << int(json.type());

	return huge_number::NaN();
}

huge_number FromJsonText(const std::string &text)
{
	Json::CharReaderBuilder builder;
	const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

	Json::Value root;
	std::string errors;

	if(!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
		if(TRACE_JSON) BOOST_LOG_TRIVIAL(trace) << "FromJsonText " << errors;

		return huge_number::NaN();
	}

	return FromJson(root);
}
