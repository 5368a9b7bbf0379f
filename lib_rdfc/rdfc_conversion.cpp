#include <fstream>
#include <chrono>
#include <filesystem>
#include "rdfc_conversion.h"
#include "rdfc_parser.h"
#include "rdfc_serializer.h"
#include "rdfc_iri.h"


namespace rdfc
{


namespace
{


// serialize to `out`, returning false if the stream failed
bool write_quads(const QuadStore& quads, std::ostream& out, size_t& out_written)
{
	out_written = serialize_nquads(quads, out);
	out.flush();
	return static_cast<bool>(out);
}


}  // namespace


std::variant<BadArguments, ConversionConfig> parse_args(const std::vector<std::string>& args)
{
	ConversionConfig config;
	bool have_input = false;

	for (size_t i = 0; i < args.size(); ++i)
	{
		const std::string& arg = args[i];

		if (arg == "-k")
		{
			config.skip_unsupported = true;
		}
		else if (arg == "-v")
		{
			config.verbose = true;
		}
		else if (arg == "-g" || arg == "-b" || arg == "-s" || arg == "-o")
		{
			if (i + 1 >= args.size())
				return BadArguments("Option '" + arg + "' needs an argument.");
			const std::string& value = args[++i];

			if (arg == "-g")
			{
				if (!has_scheme(value))
					return BadArguments("The graph name '" + value + "' must be an absolute IRI.");
				if (!iri_chars_allowed(value))
					return BadArguments("The graph name '" + value + "' contains characters which are not allowed in an IRI.");
				config.graph = value;
			}
			else if (arg == "-b")
			{
				if (!iri_chars_allowed(value))
					return BadArguments("The base IRI '" + value + "' contains characters which are not allowed in an IRI.");
				config.base = value;
			}
			else if (arg == "-s")
			{
				config.syntax = syntax_from_name(value);
				if (!config.syntax)
					return BadArguments("Unknown syntax '" + value + "'.");
			}
			else
			{
				config.output = value;
			}
		}
		else if (arg.size() > 1 && arg[0] == '-')
		{
			return BadArguments("Bad option '" + arg + "'.");
		}
		else
		{
			if (have_input)
				return BadArguments("Only one input can be converted at a time.");
			config.input = arg;
			have_input = true;
		}
	}

	return config;
}


ParseOptions make_parse_options(const ConversionConfig& config)
{
	ParseOptions options;

	if (config.syntax)
		options.syntax = *config.syntax;
	else if (config.input != "-")
		options.syntax = syntax_from_filename(config.input).value_or(Syntax::TURTLE);

	if (config.base)
		options.base_iri = *config.base;
	else if (config.input != "-")
		options.base_iri = file_iri(std::filesystem::absolute(config.input).generic_string());

	if (config.graph)
		options.graph = IRI{ *config.graph };

	if (config.skip_unsupported)
		options.unsupported = UnsupportedPolicy::SKIP_STATEMENT;

	return options;
}


void show_help(std::ostream& out)
{
	out << "Usage: named_graph_to_nquads [options] [input]" << std::endl;
	out << "Reads an RDF document and writes it out as N-Quads. With no input, "
		"or with input '-', reads standard input." << std::endl;
	out << "-h : Print help. If using this option, no other options can be used." << std::endl;
	out << "-g iri : Put every statement which is not in a named graph into "
		"this graph." << std::endl;
	out << "-b iri : Base IRI for resolving relative IRIs. Defaults to the "
		"file: IRI of the input file." << std::endl;
	out << "-s syntax : One of turtle, trig, n3, ntriples, nquads. Defaults "
		"to a guess from the input file's extension, else turtle." << std::endl;
	out << "-o filename : Write to this file instead of standard output." << std::endl;
	out << "-k : Skip statements which cannot be represented as quads "
		"(N3 formulas, variables, ...) with a warning, instead of failing." << std::endl;
	out << "-v : Print timings to standard error." << std::endl;
}


int run_conversion(const std::vector<std::string>& args,
	std::istream& in, std::ostream& out, std::ostream& err)
{
	if (args.size() == 1 && args[0] == "-h")
	{
		show_help(out);
		return CONVERSION_OK;
	}

	const auto parsed_args = parse_args(args);
	if (const BadArguments* bad = std::get_if<BadArguments>(&parsed_args))
	{
		err << bad->error << " Showing help." << std::endl;
		show_help(out);
		return CONVERSION_USAGE_ERROR;
	}

	const ConversionConfig& config = std::get<ConversionConfig>(parsed_args);
	const ParseOptions options = make_parse_options(config);
	const std::string input_name = (config.input == "-") ? "<stdin>" : config.input;

	const auto start_time = std::chrono::system_clock::now();

	ParseResult result;
	if (config.input == "-")
	{
		result = parse_document(in, options);
	}
	else
	{
		std::ifstream file(config.input, std::ios::binary);
		if (!file)
		{
			err << "Unfortunately the given file '"
				<< config.input << "' cannot be opened." << std::endl;
			return CONVERSION_USAGE_ERROR;
		}
		result = parse_document(file, options);
	}

	if (const ParseError* e = std::get_if<ParseError>(&result))
	{
		err << input_name << ':' << describe(*e) << std::endl;
		return CONVERSION_PARSE_ERROR;
	}

	const ParsedDocument& doc = std::get<ParsedDocument>(result);
	for (const ParseError& w : doc.warnings)
		err << input_name << ':' << describe(w) << " (warning: statement skipped)" << std::endl;

	const auto parsed_time = std::chrono::system_clock::now();

	if (config.verbose)
	{
		err << "Loaded " << doc.quads.size() << " quads in " <<
			std::chrono::duration_cast<std::chrono::milliseconds>(parsed_time - start_time).count()
			<< "ms." << std::endl;
	}

	size_t written;
	if (config.output == "-")
	{
		if (!write_quads(doc.quads, out, written))
		{
			err << "Failed to write to standard output." << std::endl;
			return CONVERSION_USAGE_ERROR;
		}
	}
	else
	{
		std::ofstream file(config.output, std::ios::binary);
		if (!file)
		{
			err << "Unfortunately the output file '"
				<< config.output << "' cannot be opened." << std::endl;
			return CONVERSION_USAGE_ERROR;
		}
		if (!write_quads(doc.quads, file, written))
		{
			err << "Failed to write to '" << config.output << "'." << std::endl;
			return CONVERSION_USAGE_ERROR;
		}
	}

	const auto end_time = std::chrono::system_clock::now();

	if (config.verbose)
	{
		err << "Wrote " << written << " quads in " <<
			std::chrono::duration_cast<std::chrono::milliseconds>(end_time - parsed_time).count()
			<< "ms." << std::endl;
	}

	return CONVERSION_OK;
}


}  // namespace rdfc
