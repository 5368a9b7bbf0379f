#ifndef RDFC_LEXER_H
#define RDFC_LEXER_H


#include <string>
#include <string_view>


namespace rdfc
{


enum class TokenType
{
	END,
	IRIREF,  // value: the decoded IRI, unresolved
	PNAME_NS,  // prefix: the prefix, without the colon
	PNAME_LN,  // prefix: as above, value: the unescaped local part
	BLANK_NODE_LABEL,  // value: the label, without "_:"
	STRING_LITERAL,  // value: the decoded string
	LANGTAG,  // value: the tag, without "@"
	INTEGER,  // value: the lexical form, for this and the next two
	DECIMAL,
	DOUBLE,
	TRUE_KW,
	FALSE_KW,
	A_KW,
	DOT,
	COMMA,
	SEMICOLON,
	LBRACKET,
	RBRACKET,
	LPAREN,
	RPAREN,
	LBRACE,
	RBRACE,
	DOUBLE_CARET,
	PREFIX_DIRECTIVE,  // @prefix
	BASE_DIRECTIVE,  // @base
	SPARQL_PREFIX,  // PREFIX, any case
	SPARQL_BASE,  // BASE, any case
	GRAPH_KW,  // GRAPH, any case

	// N3 only
	VARIABLE,  // value: the name, without "?"
	EQUALS,
	IMPLIES,
	IMPLIED_BY,
	EXCLAMATION,
	CARET,
	N3_KEYWORD  // value: the keyword, e.g. "forAll"
};


struct Token
{
	TokenType type = TokenType::END;
	std::string value;
	std::string prefix;
	size_t line = 0;
	size_t column = 0;
};


/*
* A short human readable name of a token type, such as
* "'.'" or "IRI", for diagnostics.
*/
std::string token_type_str(TokenType type);


/*
* A human readable rendering of a token, including its value
* where it has one, for diagnostics.
*/
std::string describe_token(const Token& tok);


/*
* Splits Turtle/TriG/N3/N-Triples/N-Quads text into tokens,
* skipping whitespace and comments.
* The text must stay alive while the lexer is used.
*
* Behaviour on errors:
* `next` throws `ParseFailure` with kind `ErrorKind::LEX` on
* unterminated strings or IRIs, invalid escape sequences, invalid
* percent-encodings, characters not allowed in the token at hand
* and invalid UTF-8. The lexer should not be used afterwards.
*/
class Lexer
{
public:
	explicit Lexer(std::string_view text);

	/*
	* Read the next token. Once the end of the text has been
	* reached, returns END tokens indefinitely.
	*/
	Token next();

	size_t line() const { return m_line; }
	size_t column() const { return m_column; }

private:
	void skip_ws_and_comments();
	Token lex_token(Token tok);

	Token lex_iri(Token tok);
	Token lex_string(Token tok);
	Token lex_number(Token tok);
	Token lex_at(Token tok);
	Token lex_variable(Token tok);
	Token lex_blank_node_label(Token tok);
	Token lex_name(Token tok);

	/*
	* Read an escape sequence (the backslash is at the current
	* position) and append its value to `out`. Only \u and \U
	* escapes are accepted if `uchar_only`.
	*/
	void lex_escape(std::string& out, bool uchar_only);
	char32_t lex_hex(size_t digits);

	/*
	* Scan the longest run of name characters starting at the
	* given offset without consuming them (for labels, prefixes and
	* variable names). A name never ends with a dot, so trailing
	* dots are excluded from the returned end offset, while
	* `out_raw_end` includes them. `out_cps` is the number of code
	* points up to the returned end offset.
	*/
	size_t scan_pn_chars(size_t from, bool allow_dots, size_t& out_cps, size_t& out_raw_end) const;

	bool at_end() const { return m_pos >= m_text.size(); }
	char peek(size_t offset = 0) const;

	// decode the code point at the current position, or fail
	char32_t current_code_point(size_t& out_len) const;

	// consume one code point, updating line and column
	char32_t consume();
	void consume_ascii(size_t n);
	// consume one code point and append its bytes to `out`
	void consume_into(std::string& out);

	[[noreturn]] void fail(const std::string& message) const;
	[[noreturn]] void fail_at(const Token& tok, const std::string& message) const;

private:
	std::string_view m_text;
	size_t m_pos;
	size_t m_line;
	size_t m_column;
	TokenType m_last;
};


/*
* Character classes of the Turtle grammar.
*/
bool is_pn_chars_base(char32_t c);
bool is_pn_chars_u(char32_t c);
bool is_pn_chars(char32_t c);


}  // namespace rdfc


#endif  // RDFC_LEXER_H
