#include <cctype>
#include <cstring>
#include "rdfc_lexer.h"
#include "rdfc_error.h"
#include "rdfc_utf8.h"
#include "rdfc_iri.h"
#include "rdfc_assert.h"


namespace rdfc
{


namespace
{


bool is_digit(char c)
{
	return c >= '0' && c <= '9';
}


bool is_hex(char c)
{
	return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}


bool is_letter(char c)
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}


unsigned hex_value(char c)
{
	if (is_digit(c))
		return c - '0';
	else if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	else
		return c - 'A' + 10;
}


std::string lower(std::string s)
{
	for (char& c : s)
	{
		if (c >= 'A' && c <= 'Z')
			c = static_cast<char>(c - 'A' + 'a');
	}
	return s;
}


}  // namespace


bool is_pn_chars_base(char32_t c)
{
	return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
		|| (c >= 0x00C0 && c <= 0x00D6) || (c >= 0x00D8 && c <= 0x00F6)
		|| (c >= 0x00F8 && c <= 0x02FF) || (c >= 0x0370 && c <= 0x037D)
		|| (c >= 0x037F && c <= 0x1FFF) || (c >= 0x200C && c <= 0x200D)
		|| (c >= 0x2070 && c <= 0x218F) || (c >= 0x2C00 && c <= 0x2FEF)
		|| (c >= 0x3001 && c <= 0xD7FF) || (c >= 0xF900 && c <= 0xFDCF)
		|| (c >= 0xFDF0 && c <= 0xFFFD) || (c >= 0x10000 && c <= 0xEFFFF);
}


bool is_pn_chars_u(char32_t c)
{
	return is_pn_chars_base(c) || c == '_';
}


bool is_pn_chars(char32_t c)
{
	return is_pn_chars_u(c) || c == '-' || (c >= '0' && c <= '9') || c == 0x00B7
		|| (c >= 0x0300 && c <= 0x036F) || (c >= 0x203F && c <= 0x2040);
}


std::string token_type_str(TokenType type)
{
	switch (type)
	{
	case TokenType::END: return "end of input";
	case TokenType::IRIREF: return "IRI";
	case TokenType::PNAME_NS: return "prefix name";
	case TokenType::PNAME_LN: return "prefixed name";
	case TokenType::BLANK_NODE_LABEL: return "blank node label";
	case TokenType::STRING_LITERAL: return "string literal";
	case TokenType::LANGTAG: return "language tag";
	case TokenType::INTEGER: return "integer";
	case TokenType::DECIMAL: return "decimal";
	case TokenType::DOUBLE: return "double";
	case TokenType::TRUE_KW: return "'true'";
	case TokenType::FALSE_KW: return "'false'";
	case TokenType::A_KW: return "'a'";
	case TokenType::DOT: return "'.'";
	case TokenType::COMMA: return "','";
	case TokenType::SEMICOLON: return "';'";
	case TokenType::LBRACKET: return "'['";
	case TokenType::RBRACKET: return "']'";
	case TokenType::LPAREN: return "'('";
	case TokenType::RPAREN: return "')'";
	case TokenType::LBRACE: return "'{'";
	case TokenType::RBRACE: return "'}'";
	case TokenType::DOUBLE_CARET: return "'^^'";
	case TokenType::PREFIX_DIRECTIVE: return "'@prefix'";
	case TokenType::BASE_DIRECTIVE: return "'@base'";
	case TokenType::SPARQL_PREFIX: return "'PREFIX'";
	case TokenType::SPARQL_BASE: return "'BASE'";
	case TokenType::GRAPH_KW: return "'GRAPH'";
	case TokenType::VARIABLE: return "variable";
	case TokenType::EQUALS: return "'='";
	case TokenType::IMPLIES: return "'=>'";
	case TokenType::IMPLIED_BY: return "'<='";
	case TokenType::EXCLAMATION: return "'!'";
	case TokenType::CARET: return "'^'";
	case TokenType::N3_KEYWORD: return "N3 keyword";
	}
	return "unknown token";
}


std::string describe_token(const Token& tok)
{
	switch (tok.type)
	{
	case TokenType::IRIREF:
		return '<' + tok.value + '>';
	case TokenType::PNAME_NS:
		return tok.prefix + ':';
	case TokenType::PNAME_LN:
		return tok.prefix + ':' + tok.value;
	case TokenType::BLANK_NODE_LABEL:
		return "_:" + tok.value;
	case TokenType::STRING_LITERAL:
		if (tok.value.size() > 20)
		{
			// don't cut a multi-byte sequence in half
			size_t cut = 20;
			while (cut > 0 && (static_cast<unsigned char>(tok.value[cut]) & 0xC0) == 0x80)
				--cut;
			return "string literal \"" + tok.value.substr(0, cut) + "...\"";
		}
		return "string literal \"" + tok.value + '"';
	case TokenType::LANGTAG:
	case TokenType::N3_KEYWORD:
		return '@' + tok.value;
	case TokenType::INTEGER:
	case TokenType::DECIMAL:
	case TokenType::DOUBLE:
		return token_type_str(tok.type) + ' ' + tok.value;
	case TokenType::VARIABLE:
		return '?' + tok.value;
	default:
		return token_type_str(tok.type);
	}
}


Lexer::Lexer(std::string_view text) :
	m_text(text),
	m_pos(0),
	m_line(1),
	m_column(1),
	m_last(TokenType::END)
{ }


Token Lexer::next()
{
	skip_ws_and_comments();

	Token tok;
	tok.line = m_line;
	tok.column = m_column;

	if (at_end())
	{
		tok.type = TokenType::END;
	}
	else
	{
		tok = lex_token(std::move(tok));
	}

	m_last = tok.type;
	return tok;
}


Token Lexer::lex_token(Token tok)
{
	const char c = peek();
	switch (c)
	{
	case '<':
		if (peek(1) == '=' && (m_pos + 2 >= m_text.size() || std::isspace(static_cast<unsigned char>(peek(2)))))
		{
			consume_ascii(2);
			tok.type = TokenType::IMPLIED_BY;
			return tok;
		}
		return lex_iri(std::move(tok));

	case '"':
	case '\'':
		return lex_string(std::move(tok));

	case '@':
		return lex_at(std::move(tok));

	case '?':
		return lex_variable(std::move(tok));

	case '_':
		if (peek(1) != ':')
			fail("'_' must be followed by ':' to start a blank node label");
		return lex_blank_node_label(std::move(tok));

	case '+': case '-':
	case '0': case '1': case '2': case '3': case '4':
	case '5': case '6': case '7': case '8': case '9':
		return lex_number(std::move(tok));

	case '.':
		if (is_digit(peek(1)))
			return lex_number(std::move(tok));
		tok.type = TokenType::DOT;
		break;

	case ',': tok.type = TokenType::COMMA; break;
	case ';': tok.type = TokenType::SEMICOLON; break;
	case '[': tok.type = TokenType::LBRACKET; break;
	case ']': tok.type = TokenType::RBRACKET; break;
	case '(': tok.type = TokenType::LPAREN; break;
	case ')': tok.type = TokenType::RPAREN; break;
	case '{': tok.type = TokenType::LBRACE; break;
	case '}': tok.type = TokenType::RBRACE; break;
	case '!': tok.type = TokenType::EXCLAMATION; break;

	case '^':
		if (peek(1) == '^')
		{
			consume_ascii(2);
			tok.type = TokenType::DOUBLE_CARET;
			return tok;
		}
		tok.type = TokenType::CARET;
		break;

	case '=':
		if (peek(1) == '>')
		{
			consume_ascii(2);
			tok.type = TokenType::IMPLIES;
			return tok;
		}
		tok.type = TokenType::EQUALS;
		break;

	case ':':
		return lex_name(std::move(tok));

	default:
	{
		size_t len;
		const char32_t cp = current_code_point(len);
		if (is_pn_chars_base(cp))
			return lex_name(std::move(tok));
		fail(std::string("unexpected character '") + std::string(m_text.substr(m_pos, len)) + "'");
	}
	}

	// single character punctuation
	consume_ascii(1);
	return tok;
}


void Lexer::skip_ws_and_comments()
{
	while (!at_end())
	{
		const char c = peek();
		if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
		{
			consume();
		}
		else if (c == '#')
		{
			// comments run to the end of the line, and must still be valid UTF-8
			while (!at_end() && peek() != '\n' && peek() != '\r')
				consume();
		}
		else
			break;
	}
}


Token Lexer::lex_iri(Token tok)
{
	RDFC_CHECK_PRECOND(peek() == '<');
	consume_ascii(1);

	while (true)
	{
		if (at_end())
			fail_at(tok, "unterminated IRI");

		const char c = peek();
		if (c == '>')
		{
			consume_ascii(1);
			break;
		}
		else if (c == '\\')
		{
			std::string decoded;
			lex_escape(decoded, true);
			char32_t cp;
			size_t len;
			if (!decode_utf8(decoded, 0, cp, len) || is_forbidden_in_iri(cp))
				fail("escape sequence produces a character which is not allowed in an IRI");
			tok.value += decoded;
		}
		else if (c == '%')
		{
			if (!is_hex(peek(1)) || !is_hex(peek(2)))
				fail("invalid percent-encoding in IRI");
			tok.value.append(m_text.substr(m_pos, 3));
			consume_ascii(3);
		}
		else if (is_forbidden_in_iri(static_cast<unsigned char>(c)))
		{
			fail(std::string("character '") + c + "' is not allowed in an IRI");
		}
		else
		{
			consume_into(tok.value);
		}
	}

	tok.type = TokenType::IRIREF;
	return tok;
}


Token Lexer::lex_string(Token tok)
{
	const char quote = peek();
	RDFC_CHECK_PRECOND(quote == '"' || quote == '\'');

	if (peek(1) == quote && peek(2) == quote)
	{
		// long string, which may span lines and contain up to two
		// consecutive unescaped quotes
		consume_ascii(3);
		while (true)
		{
			if (at_end())
				fail_at(tok, "unterminated long string");

			const char c = peek();
			if (c == quote && peek(1) == quote && peek(2) == quote)
			{
				if (peek(3) != quote)
				{
					consume_ascii(3);
					break;
				}
				// a fourth quote means this one is part of the string
				tok.value += c;
				consume_ascii(1);
			}
			else if (c == '\\')
			{
				lex_escape(tok.value, false);
			}
			else
			{
				consume_into(tok.value);
			}
		}
	}
	else
	{
		consume_ascii(1);
		while (true)
		{
			if (at_end())
				fail_at(tok, "unterminated string");

			const char c = peek();
			if (c == quote)
			{
				consume_ascii(1);
				break;
			}
			else if (c == '\n' || c == '\r')
			{
				fail_at(tok, "unterminated string (line break in a short string)");
			}
			else if (c == '\\')
			{
				lex_escape(tok.value, false);
			}
			else
			{
				consume_into(tok.value);
			}
		}
	}

	tok.type = TokenType::STRING_LITERAL;
	return tok;
}


Token Lexer::lex_number(Token tok)
{
	auto char_at = [this](size_t i) -> char
	{
		return (i < m_text.size()) ? m_text[i] : '\0';
	};

	// offset just past an exponent starting at `i`, or 0 if there is none
	auto exponent_end = [&char_at](size_t i) -> size_t
	{
		if (char_at(i) != 'e' && char_at(i) != 'E')
			return 0;
		++i;
		if (char_at(i) == '+' || char_at(i) == '-')
			++i;
		if (!is_digit(char_at(i)))
			return 0;
		while (is_digit(char_at(i)))
			++i;
		return i;
	};

	size_t i = m_pos;
	if (char_at(i) == '+' || char_at(i) == '-')
		++i;

	const size_t int_start = i;
	while (is_digit(char_at(i)))
		++i;
	const size_t int_digits = i - int_start;

	bool is_decimal = false;
	bool is_double = false;

	if (char_at(i) == '.')
	{
		if (is_digit(char_at(i + 1)))
		{
			i += 1;
			while (is_digit(char_at(i)))
				++i;
			is_decimal = true;
		}
		else if (int_digits > 0 && exponent_end(i + 1) != 0)
		{
			// "1.e5"
			i += 1;
			is_decimal = true;
		}
		// otherwise the dot is not part of the number
	}

	if (int_digits == 0 && !is_decimal)
		fail("invalid number");

	const size_t exp_end = exponent_end(i);
	if (exp_end != 0)
	{
		i = exp_end;
		is_double = true;
	}

	tok.value = std::string(m_text.substr(m_pos, i - m_pos));
	tok.type = is_double ? TokenType::DOUBLE
		: (is_decimal ? TokenType::DECIMAL : TokenType::INTEGER);
	consume_ascii(i - m_pos);
	return tok;
}


Token Lexer::lex_at(Token tok)
{
	RDFC_CHECK_PRECOND(peek() == '@');
	consume_ascii(1);

	const size_t start = m_pos;
	while (is_letter(peek()))
		consume_ascii(1);

	if (m_pos == start)
		fail("expected a language tag or a directive after '@'");

	if (m_last == TokenType::STRING_LITERAL)
	{
		while (peek() == '-' && (is_letter(peek(1)) || is_digit(peek(1))))
		{
			consume_ascii(1);
			while (is_letter(peek()) || is_digit(peek()))
				consume_ascii(1);
		}
		tok.type = TokenType::LANGTAG;
		tok.value = std::string(m_text.substr(start, m_pos - start));
		return tok;
	}

	const std::string word(m_text.substr(start, m_pos - start));
	if (word == "prefix")
		tok.type = TokenType::PREFIX_DIRECTIVE;
	else if (word == "base")
		tok.type = TokenType::BASE_DIRECTIVE;
	else if (word == "forAll" || word == "forSome" || word == "keywords"
		|| word == "a" || word == "is" || word == "of" || word == "has")
	{
		tok.type = TokenType::N3_KEYWORD;
		tok.value = word;
	}
	else
		fail_at(tok, "unknown directive '@" + word + "'");

	return tok;
}


Token Lexer::lex_variable(Token tok)
{
	RDFC_CHECK_PRECOND(peek() == '?');
	consume_ascii(1);

	size_t len;
	if (at_end())
		fail("expected a variable name after '?'");
	const char32_t first = current_code_point(len);
	if (!is_pn_chars_u(first) && !(first >= '0' && first <= '9'))
		fail("expected a variable name after '?'");

	size_t cps, raw_end;
	const size_t end = scan_pn_chars(m_pos, false, cps, raw_end);
	tok.value = std::string(m_text.substr(m_pos, end - m_pos));
	m_pos = end;
	m_column += cps;

	tok.type = TokenType::VARIABLE;
	return tok;
}


Token Lexer::lex_blank_node_label(Token tok)
{
	consume_ascii(2);  // "_:"

	size_t len;
	if (at_end())
		fail_at(tok, "empty blank node label");
	const char32_t first = current_code_point(len);
	if (!is_pn_chars_u(first) && !(first >= '0' && first <= '9'))
		fail("invalid first character of a blank node label");

	size_t cps, raw_end;
	const size_t end = scan_pn_chars(m_pos, true, cps, raw_end);
	tok.value = std::string(m_text.substr(m_pos, end - m_pos));
	m_pos = end;
	m_column += cps;

	tok.type = TokenType::BLANK_NODE_LABEL;
	return tok;
}


Token Lexer::lex_name(Token tok)
{
	size_t cps = 0;
	size_t raw_end = m_pos;
	size_t end = m_pos;
	if (peek() != ':')
		end = scan_pn_chars(m_pos, true, cps, raw_end);

	if (raw_end >= m_text.size() || m_text[raw_end] != ':')
	{
		// not a prefixed name, so must be a keyword
		const std::string word(m_text.substr(m_pos, end - m_pos));
		m_pos = end;
		m_column += cps;

		const std::string lower_word = lower(word);
		if (word == "a")
			tok.type = TokenType::A_KW;
		else if (word == "true")
			tok.type = TokenType::TRUE_KW;
		else if (word == "false")
			tok.type = TokenType::FALSE_KW;
		else if (lower_word == "prefix")
			tok.type = TokenType::SPARQL_PREFIX;
		else if (lower_word == "base")
			tok.type = TokenType::SPARQL_BASE;
		else if (lower_word == "graph")
			tok.type = TokenType::GRAPH_KW;
		else
			fail_at(tok, "unexpected bare word '" + word + "'");
		return tok;
	}

	if (end != raw_end)
		fail_at(tok, "a prefix name may not end with '.'");

	tok.prefix = std::string(m_text.substr(m_pos, end - m_pos));
	m_pos = raw_end + 1;
	m_column += cps + 1;

	// the local part; it is unescaped as it is read, but
	// percent-encodings are kept
	std::string local;
	size_t good_pos = m_pos;
	size_t good_column = m_column;
	size_t good_len = 0;
	bool first = true;
	while (!at_end())
	{
		const char c = peek();
		if (c == '%')
		{
			if (!is_hex(peek(1)) || !is_hex(peek(2)))
				fail("invalid percent-encoding in prefixed name");
			local.append(m_text.substr(m_pos, 3));
			consume_ascii(3);
		}
		else if (c == '\\')
		{
			const char e = peek(1);
			if (e == '\0' || std::strchr("_~.-!$&'()*+,;=/?#@%", e) == nullptr)
				fail("invalid escape sequence in prefixed name");
			local += e;
			consume_ascii(2);
		}
		else if (c == ':')
		{
			local += c;
			consume_ascii(1);
		}
		else if (c == '.')
		{
			if (first)
				break;
			local += c;
			consume_ascii(1);
			continue;  // a name may not end here
		}
		else
		{
			char32_t cp;
			size_t len;
			if (!decode_utf8(m_text, m_pos, cp, len) || !is_pn_chars(cp))
				break;
			if (first && !is_pn_chars_u(cp) && !(cp >= '0' && cp <= '9'))
				break;
			consume_into(local);
		}

		first = false;
		good_pos = m_pos;
		good_column = m_column;
		good_len = local.size();
	}

	// give back any trailing dots
	m_pos = good_pos;
	m_column = good_column;
	local.resize(good_len);

	tok.value = std::move(local);
	tok.type = tok.value.empty() ? TokenType::PNAME_NS : TokenType::PNAME_LN;
	return tok;
}


void Lexer::lex_escape(std::string& out, bool uchar_only)
{
	RDFC_CHECK_PRECOND(peek() == '\\');
	consume_ascii(1);

	if (at_end())
		fail("unterminated escape sequence");

	const char c = peek();
	if (c == 'u' || c == 'U')
	{
		consume_ascii(1);
		const char32_t cp = lex_hex(c == 'u' ? 4 : 8);
		if (!is_scalar_value(cp))
			fail("escape sequence does not denote a valid code point");
		append_utf8(out, cp);
		return;
	}

	if (uchar_only)
		fail("invalid escape sequence in IRI");

	switch (c)
	{
	case 't': out += '\t'; break;
	case 'b': out += '\b'; break;
	case 'n': out += '\n'; break;
	case 'r': out += '\r'; break;
	case 'f': out += '\f'; break;
	case '"': out += '"'; break;
	case '\'': out += '\''; break;
	case '\\': out += '\\'; break;
	default:
		fail(std::string("invalid escape sequence '\\") + c + "'");
	}
	consume_ascii(1);
}


char32_t Lexer::lex_hex(size_t digits)
{
	char32_t result = 0;
	for (size_t i = 0; i < digits; ++i)
	{
		const char c = peek();
		if (!is_hex(c))
			fail("invalid hexadecimal digit in escape sequence");
		result = (result << 4) | hex_value(c);
		consume_ascii(1);
	}
	return result;
}


size_t Lexer::scan_pn_chars(size_t from, bool allow_dots, size_t& out_cps, size_t& out_raw_end) const
{
	size_t i = from;
	size_t cps = 0;
	size_t good_end = from;
	size_t good_cps = 0;

	while (i < m_text.size())
	{
		char32_t cp;
		size_t len;
		if (!decode_utf8(m_text, i, cp, len))
			break;

		if (cp == '.' && allow_dots)
		{
			i += len;
			++cps;
		}
		else if (is_pn_chars(cp))
		{
			i += len;
			++cps;
			good_end = i;
			good_cps = cps;
		}
		else
			break;
	}

	out_raw_end = i;
	out_cps = good_cps;
	return good_end;
}


char Lexer::peek(size_t offset) const
{
	return (m_pos + offset < m_text.size()) ? m_text[m_pos + offset] : '\0';
}


char32_t Lexer::current_code_point(size_t& out_len) const
{
	char32_t cp;
	if (!decode_utf8(m_text, m_pos, cp, out_len))
		fail("invalid UTF-8 sequence");
	return cp;
}


char32_t Lexer::consume()
{
	size_t len;
	const char32_t cp = current_code_point(len);
	m_pos += len;

	// a lone "\r" ends a line too
	if (cp == '\n' || (cp == '\r' && peek() != '\n'))
	{
		++m_line;
		m_column = 1;
	}
	else
		++m_column;
	return cp;
}


void Lexer::consume_ascii(size_t n)
{
	for (size_t i = 0; i < n; ++i)
		consume();
}


void Lexer::consume_into(std::string& out)
{
	const size_t start = m_pos;
	consume();
	out.append(m_text.substr(start, m_pos - start));
}


void Lexer::fail(const std::string& message) const
{
	ParseError e;
	e.kind = ErrorKind::LEX;
	e.message = message;
	e.line = m_line;
	e.column = m_column;
	throw ParseFailure(std::move(e));
}


void Lexer::fail_at(const Token& tok, const std::string& message) const
{
	ParseError e;
	e.kind = ErrorKind::LEX;
	e.message = message;
	e.line = tok.line;
	e.column = tok.column;
	throw ParseFailure(std::move(e));
}


}  // namespace rdfc
