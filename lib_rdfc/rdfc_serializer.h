#ifndef RDFC_SERIALIZER_H
#define RDFC_SERIALIZER_H


#include <ostream>
#include "rdfc_types.h"
#include "rdfc_quad_store.h"
#include "rdfc_dictionary.h"


namespace rdfc
{


struct SerializerOptions
{
	// write non-ASCII code points as \u or \U escapes
	bool ascii_only = true;
};


/*
* Writes terms in N-Triples/N-Quads syntax. Blank nodes are
* relabelled "b0", "b1", ... in the order in which the writer
* first sees them, so one writer should be used per document.
*/
class NQuadsWriter
{
public:
	explicit NQuadsWriter(const SerializerOptions& options);

	std::string operator()(const IRI& i) const;
	std::string operator()(const BlankNode& b);
	std::string operator()(const Literal& l) const;
	std::string operator()(const DefaultGraph&) const;

	template<typename TermT>
	std::string term(const TermT& t)
	{
		return std::visit(*this, t);
	}

	/*
	* One statement, including the terminating " .", but not the
	* line break. The graph is omitted if it is the default graph
	* or if `with_graph` is false.
	*/
	std::string statement(const Quad& q, bool with_graph);

private:
	const SerializerOptions m_options;
	Dictionary m_blank_labels;
};


/*
* Write every quad of `store` as one N-Quads line, in canonical
* order. Returns the number of lines written.
* The output parses back to a store which is isomorphic to
* `store`.
*/
size_t serialize_nquads(const QuadStore& store, std::ostream& out,
	const SerializerOptions& options = SerializerOptions());


/*
* Write the triples of every graph of `store` as N-Triples lines,
* in canonical order. A triple present in several graphs is only
* written once. Returns the number of lines written.
*/
size_t serialize_ntriples(const QuadStore& store, std::ostream& out,
	const SerializerOptions& options = SerializerOptions());


}  // namespace rdfc


#endif  // RDFC_SERIALIZER_H
