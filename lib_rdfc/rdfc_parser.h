#ifndef RDFC_PARSER_H
#define RDFC_PARSER_H


#include <string>
#include <variant>
#include <istream>
#include <optional>
#include <string_view>
#include "rdfc_error.h"
#include "rdfc_parse_context.h"


namespace rdfc
{


typedef std::variant<ParseError, ParsedDocument> ParseResult;


/*
* Parse one whole document in the syntax given by `options`.
* This never throws for malformed input: on the first error,
* the `ParseError` alternative is returned, and no statements
* at all. Otherwise every statement of the document is in the
* returned `ParsedDocument`.
* A base IRI or graph name in `options` which could not be
* written back out (relative, or containing characters not
* allowed in an IRI) is a RESOLUTION error at 0:0.
*
* Independent parses share no state, so they may run on
* separate threads.
*/
ParseResult parse_document(std::string_view text, const ParseOptions& options = ParseOptions());


/*
* As above, but read the whole of `in` first.
*/
ParseResult parse_document(std::istream& in, const ParseOptions& options = ParseOptions());


/*
* "turtle", "trig", "n3", "ntriples" or "nquads".
*/
std::string syntax_str(Syntax syntax);
std::optional<Syntax> syntax_from_name(const std::string& name);


/*
* Guess the syntax from a file name's extension
* (.ttl, .trig, .n3, .nt, .nq), case insensitively.
*/
std::optional<Syntax> syntax_from_filename(const std::string& filename);


}  // namespace rdfc


#endif  // RDFC_PARSER_H
