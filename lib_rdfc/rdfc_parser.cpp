#include <iterator>
#include "rdfc_parser.h"
#include "rdfc_turtle.h"
#include "rdfc_nquads.h"
#include "rdfc_iri.h"


namespace rdfc
{


namespace
{


/*
* Everything the parsers take from the options ends up in the
* output, so it must be representable there too. Errors are
* reported at position 0:0, which is outside the document.
*/
std::optional<ParseError> check_options(const ParseOptions& options)
{
	if (!iri_chars_allowed(options.base_iri))
	{
		return ParseError{ ErrorKind::RESOLUTION,
			"base IRI <" + options.base_iri + "> contains a character which is not allowed in an IRI" };
	}

	if (const IRI* graph = std::get_if<IRI>(&options.graph))
	{
		if (!has_scheme(graph->val))
		{
			return ParseError{ ErrorKind::RESOLUTION,
				"graph name <" + graph->val + "> is not an absolute IRI" };
		}
		if (!iri_chars_allowed(graph->val))
		{
			return ParseError{ ErrorKind::RESOLUTION,
				"graph name <" + graph->val + "> contains a character which is not allowed in an IRI" };
		}
	}

	return std::nullopt;
}


}  // namespace


ParseResult parse_document(std::string_view text, const ParseOptions& options)
{
	if (auto bad = check_options(options))
		return *bad;

	try
	{
		switch (options.syntax)
		{
		case Syntax::NTRIPLES:
		case Syntax::NQUADS:
			return NQuadsParser(text, options).parse();
		default:
			return TurtleParser(text, options).parse();
		}
	}
	catch (const ParseFailure& e)
	{
		return e.error();
	}
}


ParseResult parse_document(std::istream& in, const ParseOptions& options)
{
	const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
	return parse_document(std::string_view(text), options);
}


std::string syntax_str(Syntax syntax)
{
	switch (syntax)
	{
	case Syntax::TURTLE:
		return "turtle";
	case Syntax::TRIG:
		return "trig";
	case Syntax::N3:
		return "n3";
	case Syntax::NTRIPLES:
		return "ntriples";
	case Syntax::NQUADS:
		return "nquads";
	}
	return "unknown";
}


std::optional<Syntax> syntax_from_name(const std::string& name)
{
	for (Syntax s : { Syntax::TURTLE, Syntax::TRIG, Syntax::N3, Syntax::NTRIPLES, Syntax::NQUADS })
	{
		if (syntax_str(s) == name)
			return s;
	}
	return std::nullopt;
}


std::optional<Syntax> syntax_from_filename(const std::string& filename)
{
	const auto dot = filename.rfind('.');
	if (dot == std::string::npos)
		return std::nullopt;

	std::string ext = filename.substr(dot + 1);
	for (char& c : ext)
	{
		if (c >= 'A' && c <= 'Z')
			c = static_cast<char>(c - 'A' + 'a');
	}

	if (ext == "ttl" || ext == "turtle")
		return Syntax::TURTLE;
	if (ext == "trig")
		return Syntax::TRIG;
	if (ext == "n3")
		return Syntax::N3;
	if (ext == "nt")
		return Syntax::NTRIPLES;
	if (ext == "nq")
		return Syntax::NQUADS;
	return std::nullopt;
}


}  // namespace rdfc
