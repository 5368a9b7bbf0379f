#include "rdfc_nquads.h"
#include "rdfc_iri.h"
#include "rdfc_assert.h"


namespace rdfc
{


NQuadsParser::NQuadsParser(std::string_view text, const ParseOptions& options) :
	m_tokens(text),
	m_options(options),
	m_ctx(std::string(), options.blank_node_prefix
		? *options.blank_node_prefix : unique_blank_node_prefix())
{
	RDFC_CHECK_PRECOND(options.syntax == Syntax::NTRIPLES
		|| options.syntax == Syntax::NQUADS);
}


ParsedDocument NQuadsParser::parse()
{
	while (m_tokens.peek().type != TokenType::END)
		statement();
	return std::move(m_doc);
}


void NQuadsParser::statement()
{
	Quad q;
	q.sub = subject();
	q.pred = iri();
	q.obj = object();

	const TokenType next = m_tokens.peek().type;
	if (next == TokenType::IRIREF || next == TokenType::BLANK_NODE_LABEL)
	{
		if (m_options.syntax == Syntax::NTRIPLES)
			m_tokens.syntax_error("'.'", m_tokens.peek());
		q.graph = graph_label();
	}
	else
		q.graph = m_options.graph;

	m_tokens.expect(TokenType::DOT, "'.'");
	m_doc.quads.add(q);
}


Subject NQuadsParser::subject()
{
	const Token& tok = m_tokens.peek();
	if (tok.type == TokenType::BLANK_NODE_LABEL)
		return m_ctx.labelled_blank_node(m_tokens.take().value);
	if (tok.type == TokenType::IRIREF)
		return iri();
	m_tokens.syntax_error("an IRI or a blank node", tok);
}


IRI NQuadsParser::iri()
{
	const Token tok = m_tokens.expect(TokenType::IRIREF, "an absolute IRI");
	if (!has_scheme(tok.value))
		m_tokens.error(ErrorKind::RESOLUTION,
			"relative IRI <" + tok.value + "> is not allowed in this format", tok);
	return IRI{ tok.value };
}


Object NQuadsParser::object()
{
	const Token& tok = m_tokens.peek();
	switch (tok.type)
	{
	case TokenType::IRIREF:
		return iri();

	case TokenType::BLANK_NODE_LABEL:
		return m_ctx.labelled_blank_node(m_tokens.take().value);

	case TokenType::STRING_LITERAL:
	{
		Token str = m_tokens.take();
		if (m_tokens.peek().type == TokenType::LANGTAG)
			return make_lang_literal(std::move(str.value), m_tokens.take().value);

		if (m_tokens.peek().type == TokenType::DOUBLE_CARET)
		{
			m_tokens.take();
			const Token at = m_tokens.peek();
			const IRI datatype = iri();
			if (datatype.val == vocab::RDF_LANG_STRING)
				m_tokens.error(ErrorKind::SYNTAX, "an rdf:langString literal needs a language tag", at);
			return make_typed_literal(std::move(str.value), datatype);
		}

		return make_literal(std::move(str.value));
	}

	default:
		m_tokens.syntax_error("an IRI, a blank node or a literal", tok);
	}
}


GraphName NQuadsParser::graph_label()
{
	const Token& tok = m_tokens.peek();
	if (tok.type == TokenType::BLANK_NODE_LABEL)
		return m_ctx.labelled_blank_node(m_tokens.take().value);
	return iri();
}


}  // namespace rdfc
