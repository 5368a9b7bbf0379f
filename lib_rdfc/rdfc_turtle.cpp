#include "rdfc_turtle.h"
#include "rdfc_assert.h"


namespace rdfc
{


namespace
{


bool is_iri_start(TokenType type)
{
	return type == TokenType::IRIREF || type == TokenType::PNAME_NS
		|| type == TokenType::PNAME_LN;
}


Object to_object(const Subject& s)
{
	return std::visit([](const auto& term) -> Object { return term; }, s);
}


}  // namespace


TurtleParser::TurtleParser(std::string_view text, const ParseOptions& options) :
	m_tokens(text),
	m_options(options),
	m_ctx(options.base_iri, options.blank_node_prefix
		? *options.blank_node_prefix : unique_blank_node_prefix()),
	m_graph(options.graph)
{
	RDFC_CHECK_PRECOND(options.syntax == Syntax::TURTLE
		|| options.syntax == Syntax::TRIG
		|| options.syntax == Syntax::N3);
}


ParsedDocument TurtleParser::parse()
{
	// in TriG, a statement may be a whole graph block
	const bool brace_ends = (m_options.syntax == Syntax::TRIG);

	while (m_tokens.peek().type != TokenType::END)
	{
		const int start_depth = m_tokens.depth();
		try
		{
			statement();
		}
		catch (const ParseFailure& e)
		{
			skip_or_rethrow(e, start_depth, brace_ends);
		}
	}

	RDFC_CHECK_POSTCOND(m_pending.empty());

	m_doc.base = m_ctx.base();
	m_doc.prefixes = m_ctx.prefixes();
	return std::move(m_doc);
}


void TurtleParser::statement()
{
	const Token& tok = m_tokens.peek();
	switch (tok.type)
	{
	case TokenType::PREFIX_DIRECTIVE:
	case TokenType::BASE_DIRECTIVE:
	case TokenType::SPARQL_PREFIX:
	case TokenType::SPARQL_BASE:
		directive();
		return;

	case TokenType::N3_KEYWORD:
		unsupported("the N3 directive @" + tok.value, tok);

	case TokenType::GRAPH_KW:
		if (m_options.syntax != Syntax::TRIG)
			m_tokens.syntax_error("a statement", tok);
		m_tokens.take();
		wrapped_graph(graph_label());
		return;

	case TokenType::LBRACE:
		if (m_options.syntax != Syntax::TRIG)
			unsupported("N3 formulas", tok);
		// a block without a label holds default graph statements
		wrapped_graph(m_options.graph);
		return;

	default:
		break;
	}

	if (m_options.syntax == Syntax::TRIG)
	{
		const TokenType next = m_tokens.peek(1).type;
		const bool labelled_block = (is_iri_start(tok.type) || tok.type == TokenType::BLANK_NODE_LABEL)
			&& next == TokenType::LBRACE;
		const bool anon_block = tok.type == TokenType::LBRACKET && next == TokenType::RBRACKET
			&& m_tokens.peek(2).type == TokenType::LBRACE;

		if (labelled_block || anon_block)
		{
			wrapped_graph(graph_label());
			return;
		}
	}

	triples();
	m_tokens.expect(TokenType::DOT, "'.'");
	commit();
}


void TurtleParser::directive()
{
	const Token tok = m_tokens.take();
	switch (tok.type)
	{
	case TokenType::PREFIX_DIRECTIVE:
		prefix_id();
		m_tokens.expect(TokenType::DOT, "'.' after @prefix");
		break;
	case TokenType::BASE_DIRECTIVE:
		base();
		m_tokens.expect(TokenType::DOT, "'.' after @base");
		break;
	case TokenType::SPARQL_PREFIX:
		prefix_id();
		break;
	case TokenType::SPARQL_BASE:
		base();
		break;
	default:
		RDFC_CHECK_PRECOND(false);
	}
}


void TurtleParser::prefix_id()
{
	const Token name = m_tokens.expect(TokenType::PNAME_NS, "a prefix name such as 'ex:'");
	const Token ref = m_tokens.expect(TokenType::IRIREF, "an IRI");

	auto resolved = m_ctx.resolve(ref.value);
	if (!resolved)
		m_tokens.error(ErrorKind::RESOLUTION,
			"relative IRI <" + ref.value + "> with no base IRI in scope", ref);

	m_ctx.set_prefix(name.prefix, std::move(*resolved));
}


void TurtleParser::base()
{
	const Token ref = m_tokens.expect(TokenType::IRIREF, "an IRI");

	// a relative base is resolved against the previous one
	auto resolved = m_ctx.resolve(ref.value);
	if (!resolved)
		m_tokens.error(ErrorKind::RESOLUTION,
			"relative base IRI <" + ref.value + "> with no base IRI in scope", ref);

	m_ctx.set_base(std::move(*resolved));
}


void TurtleParser::wrapped_graph(GraphName graph)
{
	m_tokens.expect(TokenType::LBRACE, "'{'");

	const GraphName outer = m_graph;
	m_graph = std::move(graph);

	while (m_tokens.peek().type != TokenType::RBRACE)
	{
		const int start_depth = m_tokens.depth();
		try
		{
			triples();

			// the last statement of a block needs no dot
			if (m_tokens.peek().type == TokenType::DOT)
				m_tokens.take();
			else if (m_tokens.peek().type != TokenType::RBRACE)
				m_tokens.syntax_error("'.' or '}'", m_tokens.peek());

			commit();
		}
		catch (const ParseFailure& e)
		{
			skip_or_rethrow(e, start_depth, false);
		}
	}

	m_tokens.expect(TokenType::RBRACE, "'}'");
	m_graph = outer;
}


void TurtleParser::triples()
{
	const Token& tok = m_tokens.peek();

	// "[ :p :o ] ." is a statement on its own
	if (tok.type == TokenType::LBRACKET && m_tokens.peek(1).type != TokenType::RBRACKET)
	{
		const BlankNode node = blank_node_property_list();
		if (at_verb())
			predicate_object_list(node);
		return;
	}

	const Subject s = subject();
	predicate_object_list(s);
}


void TurtleParser::predicate_object_list(const Subject& subject)
{
	bool reversed = false;
	IRI predicate = verb(reversed);
	object_list(subject, predicate, reversed);

	while (m_tokens.peek().type == TokenType::SEMICOLON)
	{
		// repeated semicolons are allowed, as is a trailing one
		while (m_tokens.peek().type == TokenType::SEMICOLON)
			m_tokens.take();

		if (!at_verb())
			break;

		predicate = verb(reversed);
		object_list(subject, predicate, reversed);
	}
}


void TurtleParser::object_list(const Subject& subject, const IRI& predicate, bool reversed)
{
	while (true)
	{
		const Token at = m_tokens.peek();
		const Object o = object();

		if (!reversed)
		{
			emit(subject, predicate, o);
		}
		else if (const IRI* i = std::get_if<IRI>(&o))
		{
			emit(*i, predicate, to_object(subject));
		}
		else if (const BlankNode* b = std::get_if<BlankNode>(&o))
		{
			emit(*b, predicate, to_object(subject));
		}
		else
		{
			unsupported("a literal in subject position", at);
		}

		if (m_tokens.peek().type != TokenType::COMMA)
			break;
		m_tokens.take();
	}
}


Subject TurtleParser::subject()
{
	const Token& tok = m_tokens.peek();
	Subject result;

	switch (tok.type)
	{
	case TokenType::IRIREF:
	case TokenType::PNAME_NS:
	case TokenType::PNAME_LN:
		result = iri();
		break;
	case TokenType::BLANK_NODE_LABEL:
		result = m_ctx.labelled_blank_node(m_tokens.take().value);
		break;
	case TokenType::LBRACKET:
		result = blank_node_property_list();
		break;
	case TokenType::LPAREN:
		result = collection();
		break;
	case TokenType::VARIABLE:
		unsupported("N3 variables", tok);
	case TokenType::LBRACE:
		unsupported("N3 formulas", tok);
	default:
		m_tokens.syntax_error("a subject", tok);
	}

	check_no_path();
	return result;
}


IRI TurtleParser::verb(bool& out_reversed)
{
	out_reversed = false;
	const Token tok = m_tokens.peek();

	switch (tok.type)
	{
	case TokenType::A_KW:
		m_tokens.take();
		return IRI{ vocab::RDF_TYPE };

	case TokenType::IRIREF:
	case TokenType::PNAME_NS:
	case TokenType::PNAME_LN:
		return iri();

	case TokenType::EQUALS:
	case TokenType::IMPLIES:
	case TokenType::IMPLIED_BY:
		if (m_options.syntax != Syntax::N3)
			m_tokens.syntax_error("a predicate", tok);
		m_tokens.take();
		if (tok.type == TokenType::EQUALS)
			return IRI{ vocab::OWL_SAME_AS };
		out_reversed = (tok.type == TokenType::IMPLIED_BY);
		return IRI{ vocab::LOG_IMPLIES };

	case TokenType::VARIABLE:
		unsupported("N3 variables", tok);

	case TokenType::N3_KEYWORD:
		unsupported("the N3 keyword @" + tok.value, tok);

	default:
		m_tokens.syntax_error("a predicate IRI", tok);
	}
}


Object TurtleParser::object()
{
	const Token& tok = m_tokens.peek();
	Object result;

	switch (tok.type)
	{
	case TokenType::IRIREF:
	case TokenType::PNAME_NS:
	case TokenType::PNAME_LN:
		result = iri();
		break;
	case TokenType::BLANK_NODE_LABEL:
		result = m_ctx.labelled_blank_node(m_tokens.take().value);
		break;
	case TokenType::LBRACKET:
		result = blank_node_property_list();
		break;
	case TokenType::LPAREN:
		result = to_object(collection());
		break;
	case TokenType::STRING_LITERAL:
		result = literal();
		break;
	case TokenType::INTEGER:
		result = make_typed_literal(m_tokens.take().value, IRI{ vocab::XSD_INTEGER });
		break;
	case TokenType::DECIMAL:
		result = make_typed_literal(m_tokens.take().value, IRI{ vocab::XSD_DECIMAL });
		break;
	case TokenType::DOUBLE:
		result = make_typed_literal(m_tokens.take().value, IRI{ vocab::XSD_DOUBLE });
		break;
	case TokenType::TRUE_KW:
		m_tokens.take();
		result = make_typed_literal("true", IRI{ vocab::XSD_BOOLEAN });
		break;
	case TokenType::FALSE_KW:
		m_tokens.take();
		result = make_typed_literal("false", IRI{ vocab::XSD_BOOLEAN });
		break;
	case TokenType::VARIABLE:
		unsupported("N3 variables", tok);
	case TokenType::LBRACE:
		unsupported("N3 formulas", tok);
	default:
		m_tokens.syntax_error("an object", tok);
	}

	check_no_path();
	return result;
}


IRI TurtleParser::iri()
{
	const Token tok = m_tokens.take();

	if (tok.type == TokenType::IRIREF)
	{
		auto resolved = m_ctx.resolve(tok.value);
		if (!resolved)
			m_tokens.error(ErrorKind::RESOLUTION,
				"relative IRI <" + tok.value + "> with no base IRI in scope", tok);
		return IRI{ std::move(*resolved) };
	}

	if (tok.type == TokenType::PNAME_NS || tok.type == TokenType::PNAME_LN)
	{
		const std::string* ns = m_ctx.find_prefix(tok.prefix);
		if (ns == nullptr)
			m_tokens.error(ErrorKind::RESOLUTION, "undeclared prefix '" + tok.prefix + ":'", tok);
		return IRI{ *ns + tok.value };
	}

	m_tokens.syntax_error("an IRI", tok);
}


Literal TurtleParser::literal()
{
	Token str = m_tokens.expect(TokenType::STRING_LITERAL, "a string literal");

	if (m_tokens.peek().type == TokenType::LANGTAG)
	{
		const Token tag = m_tokens.take();
		return make_lang_literal(std::move(str.value), tag.value);
	}

	if (m_tokens.peek().type == TokenType::DOUBLE_CARET)
	{
		m_tokens.take();
		const Token at = m_tokens.peek();
		if (!is_iri_start(at.type))
			m_tokens.syntax_error("a datatype IRI", at);

		const IRI datatype = iri();
		if (datatype.val == vocab::RDF_LANG_STRING)
			m_tokens.error(ErrorKind::SYNTAX, "an rdf:langString literal needs a language tag", at);
		return make_typed_literal(std::move(str.value), datatype);
	}

	return make_literal(std::move(str.value));
}


BlankNode TurtleParser::blank_node_property_list()
{
	m_tokens.expect(TokenType::LBRACKET, "'['");
	const BlankNode node = m_ctx.fresh_blank_node();

	if (m_tokens.peek().type == TokenType::RBRACKET)
	{
		m_tokens.take();
		return node;
	}

	predicate_object_list(node);
	m_tokens.expect(TokenType::RBRACKET, "']'");
	return node;
}


Subject TurtleParser::collection()
{
	m_tokens.expect(TokenType::LPAREN, "'('");

	std::vector<Object> items;
	while (m_tokens.peek().type != TokenType::RPAREN)
		items.push_back(object());
	m_tokens.take();

	if (items.empty())
		return IRI{ vocab::RDF_NIL };

	std::vector<BlankNode> nodes;
	for (size_t i = 0; i < items.size(); ++i)
		nodes.push_back(m_ctx.fresh_blank_node());

	for (size_t i = 0; i < items.size(); ++i)
	{
		emit(nodes[i], IRI{ vocab::RDF_FIRST }, items[i]);
		if (i + 1 < nodes.size())
			emit(nodes[i], IRI{ vocab::RDF_REST }, nodes[i + 1]);
		else
			emit(nodes[i], IRI{ vocab::RDF_REST }, IRI{ vocab::RDF_NIL });
	}

	return nodes.front();
}


GraphName TurtleParser::graph_label()
{
	const Token& tok = m_tokens.peek();

	switch (tok.type)
	{
	case TokenType::IRIREF:
	case TokenType::PNAME_NS:
	case TokenType::PNAME_LN:
		return iri();
	case TokenType::BLANK_NODE_LABEL:
		return m_ctx.labelled_blank_node(m_tokens.take().value);
	case TokenType::LBRACKET:
		m_tokens.take();
		m_tokens.expect(TokenType::RBRACKET, "']'");
		return m_ctx.fresh_blank_node();
	case TokenType::VARIABLE:
		unsupported("N3 variables", tok);
	default:
		m_tokens.syntax_error("a graph name", tok);
	}
}


bool TurtleParser::at_verb()
{
	switch (m_tokens.peek().type)
	{
	case TokenType::IRIREF:
	case TokenType::PNAME_NS:
	case TokenType::PNAME_LN:
	case TokenType::A_KW:
	case TokenType::EQUALS:
	case TokenType::IMPLIES:
	case TokenType::IMPLIED_BY:
	case TokenType::VARIABLE:
	case TokenType::N3_KEYWORD:
		return true;
	default:
		return false;
	}
}


void TurtleParser::check_no_path()
{
	const Token& tok = m_tokens.peek();
	if (tok.type == TokenType::EXCLAMATION || tok.type == TokenType::CARET)
		unsupported("N3 path expressions", tok);
}


void TurtleParser::emit(const Subject& s, const IRI& p, const Object& o)
{
	m_pending.push_back(Quad{ s, p, o, m_graph });
}


void TurtleParser::commit()
{
	for (const Quad& q : m_pending)
		m_doc.quads.add(q);
	m_pending.clear();
}


void TurtleParser::skip_or_rethrow(const ParseFailure& e, int start_depth, bool brace_ends)
{
	if (e.error().kind != ErrorKind::UNSUPPORTED
		|| m_options.unsupported != UnsupportedPolicy::SKIP_STATEMENT)
		throw;

	m_pending.clear();
	m_doc.warnings.push_back(e.error());

	while (true)
	{
		const Token& tok = m_tokens.peek();
		if (tok.type == TokenType::END)
			return;

		if (m_tokens.depth() == start_depth)
		{
			if (tok.type == TokenType::DOT)
			{
				m_tokens.take();
				return;
			}
			// closes an enclosing graph block, which is not ours to skip
			if (tok.type == TokenType::RBRACE)
				return;
		}

		const TokenType type = m_tokens.take().type;
		if (brace_ends && type == TokenType::RBRACE && m_tokens.depth() == start_depth)
			return;
	}
}


void TurtleParser::unsupported(const std::string& what, const Token& at) const
{
	m_tokens.error(ErrorKind::UNSUPPORTED, what + " cannot be represented as quads", at);
}


}  // namespace rdfc
