#include "huge_number.hpp"
#include "format.hpp"
#include "json.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;



//-TYPE-DEFINITIONS----------------------------------------------------------------------------------------------------

using unary_op_t = huge_number (*)(const huge_number &);
using binary_op_t = huge_number (*)(const huge_number &, const huge_number &);

struct hnum_options {
	int traceLevel = 0;
	std::string format;
	bool json = false;
	std::string operation;
	std::vector<std::string> operands;
};

static constexpr const char *ProgramName = "hnum";



//-OPERATION-TABLES----------------------------------------------------------------------------------------------------

static const std::map<std::string, unary_op_t> &unaryOperations()
{
	static const std::map<std::string, unary_op_t> operations = {
			{"neg", huge_number::Negate},
			{"abs", huge_number::Abs},
			{"reciprocal", huge_number::Reciprocal},
			{"square", huge_number::Square},
			{"cube", huge_number::Cube},
			{"sqrt", huge_number::Sqrt},
			{"cbrt", huge_number::Cbrt},
			{"exp", huge_number::Exp},
			{"exp2", huge_number::Exp2},
			{"exp10", huge_number::Exp10},
			{"log", [](const huge_number &x) { return huge_number::Log(x); }},
			{"log2", huge_number::Log2},
			{"log10", huge_number::Log10},
			{"sin", huge_number::Sin},
			{"cos", huge_number::Cos},
			{"tan", huge_number::Tan},
			{"asin", huge_number::Asin},
			{"acos", huge_number::Acos},
			{"atan", huge_number::Atan},
			{"sinpi", huge_number::SinPi},
			{"cospi", huge_number::CosPi},
			{"tanpi", huge_number::TanPi},
			{"asinpi", huge_number::AsinPi},
			{"acospi", huge_number::AcosPi},
			{"atanpi", huge_number::AtanPi},
			{"sinh", huge_number::Sinh},
			{"cosh", huge_number::Cosh},
			{"tanh", huge_number::Tanh},
			{"asinh", huge_number::Asinh},
			{"acosh", huge_number::Acosh},
			{"atanh", huge_number::Atanh},
			{"floor", huge_number::Floor},
			{"ceiling", huge_number::Ceiling},
			{"truncate", huge_number::Truncate},
			{"round", [](const huge_number &x) { return huge_number::Round(x); }},
			{"decimal", huge_number::ToDecimal},
			{"ilogb", [](const huge_number &x) { return huge_number(huge_number::ILogB(x)); }},
	};

	return operations;
}

static const std::map<std::string, binary_op_t> &binaryOperations()
{
	static const std::map<std::string, binary_op_t> operations = {
			{"add", huge_number::Add},
			{"sub", huge_number::Subtract},
			{"mul", huge_number::Multiply},
			{"div", huge_number::Divide},
			{"mod", huge_number::Mod},
			{"rem", huge_number::IEEERemainder},
			{"pow", huge_number::Pow},
			{"logb", [](const huge_number &x, const huge_number &base) { return huge_number::Log(x, base); }},
			{"atan2", huge_number::Atan2},
			{"atan2pi", huge_number::Atan2Pi},
			{"hypot", huge_number::Hypot},
			{"min", huge_number::Min},
			{"max", huge_number::Max},
			{"minmag", huge_number::MinMagnitude},
			{"maxmag", huge_number::MaxMagnitude},
			{"cmp", [](const huge_number &x, const huge_number &y) { return huge_number(huge_number::CompareTo(x, y)); }},
	};

	return operations;
}



//-COMMAND-LINE--------------------------------------------------------------------------------------------------------

// Shows records at or above fatal - level
static void setTraceLevel(int level)
{
	boost::log::core::get()->set_filter(boost::log::trivial::severity > int(boost::log::trivial::fatal) - level);
}

static huge_number parseOperand(const std::string &text)
{
	huge_number value;

	if(!huge_number::TryParse(text, value))
		throw std::invalid_argument("unable to parse operand \"" + text + "\"");

	return value;
}

static void printUsage(const po::options_description &visible)
{
	std::cout << "usage: " << ProgramName << " [options] <op> <a> [b]" << std::endl << std::endl;
	std::cout << visible << std::endl;

	std::cout << "unary ops:";
	for(const auto &operation : unaryOperations())
		std::cout << " " << operation.first;
	std::cout << std::endl;

	std::cout << "binary ops:";
	for(const auto &operation : binaryOperations())
		std::cout << " " << operation.first;
	std::cout << std::endl;
}

// Returns false when only the usage was requested
static bool processOptions(int argc, char **argv, hnum_options &options)
{
	po::options_description visible("");
	visible.add_options()
			("help", "Display this message.")
			("trace", po::value<int>(&options.traceLevel)->default_value(options.traceLevel), "Trace level (0=none; 6=all).")
			("format", po::value<std::string>(&options.format)->default_value("G"),
			 "Output format (G, R, E, F, N, P or C, with optional precision).")
			("json", po::bool_switch(&options.json), "Output the stored fields as JSON.");

	po::options_description hidden("");
	hidden.add_options()
			("op", po::value<std::string>(&options.operation), "Operation.")
			("operand", po::value<std::vector<std::string>>(&options.operands), "Operands.");

	po::positional_options_description positional;
	positional.add("op", 1).add("operand", -1);

	po::options_description all;
	all.add(visible).add(hidden);

	po::variables_map variables;
	po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), variables);

	if(variables.count("help") || !variables.count("op")) {
		printUsage(visible);
		return false;
	}

	po::notify(variables);
	setTraceLevel(options.traceLevel);

	return true;
}



//-EVALUATION----------------------------------------------------------------------------------------------------------

static huge_number evaluate(const hnum_options &options)
{
	const auto unary = unaryOperations().find(options.operation);

	if(unary != unaryOperations().end()) {
		if(options.operands.size() != 1)
			throw std::invalid_argument(options.operation + " takes one operand");

		return unary->second(parseOperand(options.operands[0]));
	}

	const auto binary = binaryOperations().find(options.operation);

	if(binary != binaryOperations().end()) {
		if(options.operands.size() != 2)
			throw std::invalid_argument(options.operation + " takes two operands");

		return binary->second(parseOperand(options.operands[0]), parseOperand(options.operands[1]));
	}

	throw std::invalid_argument("unknown operation \"" + options.operation + "\"");
}

int main(int argc, char *argv[])
{
	hnum_options options;

	setTraceLevel(options.traceLevel);

	try {
		if(!processOptions(argc, argv, options))
			return 1;

		const huge_number result = evaluate(options);

		BOOST_LOG_TRIVIAL(debug) << ProgramName << " " << options.operation << " fields " << result.mantissa() << " "
								 << result.exponent() << " " << result.denominator();

		if(options.json) {
			Json::StreamWriterBuilder builder;
			builder["indentation"] = "";

			std::cout << Json::writeString(builder, ToJsonFields(result)) << std::endl;
		}
		else
			std::cout << huge_number::ToString(result, options.format) << std::endl;
	}
	catch(const std::exception &e) {
		std::cerr << "ERROR: " << e.what() << std::endl;
		return -1;
	}

	return 0;
}
