#include <sstream>
#include "rdfc_error.h"


namespace rdfc
{


std::string kind_str(ErrorKind kind)
{
	switch (kind)
	{
	case ErrorKind::LEX:
		return "lex";
	case ErrorKind::SYNTAX:
		return "syntax";
	case ErrorKind::RESOLUTION:
		return "resolution";
	case ErrorKind::UNSUPPORTED:
		return "unsupported construct";
	}
	return "unknown";
}


std::string describe(const ParseError& e)
{
	std::stringstream ss;
	ss << e.line << ':' << e.column << ": " << kind_str(e.kind)
		<< " error: " << e.message;

	if (!e.expected.empty() || !e.found.empty())
	{
		ss << " (";
		if (!e.expected.empty())
			ss << "expected " << e.expected;
		if (!e.expected.empty() && !e.found.empty())
			ss << ", ";
		if (!e.found.empty())
			ss << "found " << e.found;
		ss << ')';
	}

	return ss.str();
}


ParseFailure::ParseFailure(ParseError e) :
	m_error(std::move(e)),
	m_what(describe(m_error))
{ }


}  // namespace rdfc
