#include "rdfc_token_stream.h"


namespace rdfc
{


TokenStream::TokenStream(std::string_view text) :
	m_lexer(text),
	m_depth(0)
{ }


const Token& TokenStream::peek(size_t n)
{
	while (m_lookahead.size() <= n)
		m_lookahead.push_back(m_lexer.next());
	return m_lookahead[n];
}


Token TokenStream::take()
{
	peek();
	Token tok = std::move(m_lookahead.front());
	m_lookahead.pop_front();

	switch (tok.type)
	{
	case TokenType::LBRACKET:
	case TokenType::LPAREN:
	case TokenType::LBRACE:
		++m_depth;
		break;
	case TokenType::RBRACKET:
	case TokenType::RPAREN:
	case TokenType::RBRACE:
		--m_depth;
		break;
	default:
		break;
	}

	return tok;
}


Token TokenStream::expect(TokenType type, const std::string& expected)
{
	if (peek().type != type)
		syntax_error(expected, peek());
	return take();
}


void TokenStream::syntax_error(const std::string& expected, const Token& found) const
{
	ParseError e;
	e.kind = ErrorKind::SYNTAX;
	e.message = "unexpected " + describe_token(found);
	e.expected = expected;
	e.found = describe_token(found);
	e.line = found.line;
	e.column = found.column;
	throw ParseFailure(std::move(e));
}


void TokenStream::error(ErrorKind kind, const std::string& message, const Token& at) const
{
	ParseError e;
	e.kind = kind;
	e.message = message;
	e.line = at.line;
	e.column = at.column;
	throw ParseFailure(std::move(e));
}


}  // namespace rdfc
