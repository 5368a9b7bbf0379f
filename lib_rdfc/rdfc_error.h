#ifndef RDFC_ERROR_H
#define RDFC_ERROR_H


#include <string>
#include <exception>


namespace rdfc
{


enum class ErrorKind
{
	LEX,  // malformed token
	SYNTAX,  // token stream matches no production
	RESOLUTION,  // relative IRI without a base, or undeclared prefix
	UNSUPPORTED  // construct which cannot be represented as quads
};


/*
* A diagnostic for a failed (or, for warnings, partially
* skipped) parse. `expected` and `found` are only filled in
* for syntax errors. Lines and columns are 1-based, and
* columns count code points.
*/
struct ParseError
{
	ErrorKind kind;
	std::string message;
	std::string expected;
	std::string found;
	size_t line = 0;
	size_t column = 0;
};


/*
* "lex", "syntax", "resolution" or "unsupported construct".
*/
std::string kind_str(ErrorKind kind);


/*
* Render as "line:column: <kind> error: <message>", followed by
* "(expected X, found Y)" where these are known.
*/
std::string describe(const ParseError& e);


/*
* Thrown internally by the lexer and the parsers to unwind a
* failed parse. It never escapes the public parse functions,
* which convert it back to the `ParseError` alternative of their
* return value.
*/
class ParseFailure :
	public std::exception
{
public:
	explicit ParseFailure(ParseError e);

	const ParseError& error() const { return m_error; }
	const char* what() const noexcept override { return m_what.c_str(); }

private:
	ParseError m_error;
	std::string m_what;
};


}  // namespace rdfc


#endif  // RDFC_ERROR_H
