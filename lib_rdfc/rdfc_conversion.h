#ifndef RDFC_CONVERSION_H
#define RDFC_CONVERSION_H


#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <istream>
#include <ostream>
#include "rdfc_parse_context.h"


namespace rdfc
{


/*
* Exit statuses of the conversion utility.
*/
enum ConversionStatus
{
	CONVERSION_OK = 0,
	CONVERSION_PARSE_ERROR = 1,
	CONVERSION_USAGE_ERROR = 2  // bad arguments, or an I/O failure
};


/*
* Everything the command line can configure. An input or
* output of "-" means the standard stream.
*/
struct ConversionConfig
{
	std::string input = "-";
	std::string output = "-";
	std::optional<std::string> graph;
	std::optional<std::string> base;
	std::optional<Syntax> syntax;
	bool skip_unsupported = false;
	bool verbose = false;
};


struct BadArguments
{
	BadArguments(std::string e) :
		error(std::move(e))
	{ }
	std::string error;
};


/*
* Parse the command line arguments (not including the program
* name). `-h` is not handled here, see `run_conversion`.
*/
std::variant<BadArguments, ConversionConfig> parse_args(const std::vector<std::string>& args);


/*
* Work out the parse options: the syntax from `-s` or else the
* input's extension, and the base from `-b` or else the file:
* IRI of the input.
*/
ParseOptions make_parse_options(const ConversionConfig& config);


void show_help(std::ostream& out);


/*
* The whole utility. Reads the input named by `args` (or `in`),
* writes N-Quads to the output it names (or `out`) and
* diagnostics to `err`, and returns a `ConversionStatus`.
*/
int run_conversion(const std::vector<std::string>& args,
	std::istream& in, std::ostream& out, std::ostream& err);


}  // namespace rdfc


#endif  // RDFC_CONVERSION_H
