#include "rdfc_serializer.h"
#include "rdfc_assert.h"


namespace rdfc
{


NQuadsWriter::NQuadsWriter(const SerializerOptions& options) :
	m_options(options)
{ }


std::string NQuadsWriter::operator()(const IRI& i) const
{
	return '<' + escape_iri(i.val, m_options.ascii_only) + '>';
}


std::string NQuadsWriter::operator()(const BlankNode& b)
{
	return "_:b" + std::to_string(m_blank_labels.encode(b.label));
}


std::string NQuadsWriter::operator()(const Literal& l) const
{
	std::string result = '"' + escape_literal_value(l.val, m_options.ascii_only) + '"';
	if (l.has_lang())
		result += '@' + l.lang;
	else if (!l.dtype.empty())
		result += "^^" + (*this)(IRI{ l.dtype });
	return result;
}


std::string NQuadsWriter::operator()(const DefaultGraph&) const
{
	return std::string();
}


std::string NQuadsWriter::statement(const Quad& q, bool with_graph)
{
	std::string line = term(q.sub) + ' ' + (*this)(q.pred) + ' ' + term(q.obj);
	if (with_graph && !std::holds_alternative<DefaultGraph>(q.graph))
		line += ' ' + term(q.graph);
	line += " .";
	return line;
}


size_t serialize_nquads(const QuadStore& store, std::ostream& out, const SerializerOptions& options)
{
	NQuadsWriter writer(options);
	size_t count = 0;

	auto iter = store.scan();
	iter->start();
	while (iter->valid())
	{
		out << writer.statement(iter->current(), true) << '\n';
		iter->next();
		++count;
	}

	RDFC_CHECK_POSTCOND(count == store.size());
	return count;
}


size_t serialize_ntriples(const QuadStore& store, std::ostream& out, const SerializerOptions& options)
{
	// collapse the graphs first, so that duplicates disappear and
	// the triples come out in canonical order
	QuadStore triples;
	auto iter = store.scan();
	iter->start();
	while (iter->valid())
	{
		triples.add(make_quad(iter->current().triple()));
		iter->next();
	}

	return serialize_nquads(triples, out, options);
}


}  // namespace rdfc
