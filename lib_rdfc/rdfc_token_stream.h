#ifndef RDFC_TOKEN_STREAM_H
#define RDFC_TOKEN_STREAM_H


#include <deque>
#include <string>
#include <string_view>
#include "rdfc_lexer.h"
#include "rdfc_error.h"


namespace rdfc
{


/*
* Wraps a lexer with a lookahead buffer, for the recursive
* descent parsers. It also keeps track of how deeply nested
* the consumed tokens are in brackets, parentheses and braces,
* which is what the parsers use to find the end of a statement
* they have given up on.
*/
class TokenStream
{
public:
	explicit TokenStream(std::string_view text);

	/*
	* The token `n` places ahead, without consuming anything.
	*/
	const Token& peek(size_t n = 0);

	/*
	* Consume and return the next token.
	*/
	Token take();

	/*
	* Consume the next token if it has type `type`, else fail
	* with a syntax error saying that `expected` was expected.
	*/
	Token expect(TokenType type, const std::string& expected);

	/*
	* The nesting depth of the tokens consumed so far.
	*/
	int depth() const { return m_depth; }

	[[noreturn]] void syntax_error(const std::string& expected, const Token& found) const;
	[[noreturn]] void error(ErrorKind kind, const std::string& message, const Token& at) const;

private:
	Lexer m_lexer;
	std::deque<Token> m_lookahead;
	int m_depth;
};


}  // namespace rdfc


#endif  // RDFC_TOKEN_STREAM_H
