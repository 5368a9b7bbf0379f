#ifndef RDFC_TYPES_H
#define RDFC_TYPES_H


#include <string>
#include <variant>
#include <tuple>


namespace rdfc
{


namespace vocab
{


constexpr const char* RDF_TYPE = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
constexpr const char* RDF_FIRST = "http://www.w3.org/1999/02/22-rdf-syntax-ns#first";
constexpr const char* RDF_REST = "http://www.w3.org/1999/02/22-rdf-syntax-ns#rest";
constexpr const char* RDF_NIL = "http://www.w3.org/1999/02/22-rdf-syntax-ns#nil";
constexpr const char* RDF_LANG_STRING = "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";
constexpr const char* XSD_STRING = "http://www.w3.org/2001/XMLSchema#string";
constexpr const char* XSD_INTEGER = "http://www.w3.org/2001/XMLSchema#integer";
constexpr const char* XSD_DECIMAL = "http://www.w3.org/2001/XMLSchema#decimal";
constexpr const char* XSD_DOUBLE = "http://www.w3.org/2001/XMLSchema#double";
constexpr const char* XSD_BOOLEAN = "http://www.w3.org/2001/XMLSchema#boolean";
constexpr const char* OWL_SAME_AS = "http://www.w3.org/2002/07/owl#sameAs";
constexpr const char* LOG_IMPLIES = "http://www.w3.org/2000/10/swap/log#implies";


}  // namespace vocab


struct IRI
{
	std::string val;

	inline bool operator == (const IRI& other) const { return val == other.val; }
	inline bool operator != (const IRI& other) const { return val != other.val; }
	inline bool operator < (const IRI& other) const { return val < other.val; }
};


/*
* A blank node is identified by its label alone. Labels
* are assigned by the parser (or by whoever constructs the
* node programmatically) and are not the labels written in
* the source document.
*/
struct BlankNode
{
	std::string label;

	inline bool operator == (const BlankNode& other) const { return label == other.label; }
	inline bool operator != (const BlankNode& other) const { return label != other.label; }
	inline bool operator < (const BlankNode& other) const { return label < other.label; }
};


/*
* A literal. Construct these with the `make_*literal`
* functions below, which maintain the following invariants:
* - at most one of `lang` and `dtype` is nonempty
* - `lang` is lower case
* - `dtype` is never xsd:string (that is the implicit datatype
*   of a literal with neither a language nor a datatype)
*/
struct Literal
{
	std::string val;
	std::string lang;  // empty if untagged
	std::string dtype;  // empty if implicit

	bool has_lang() const { return !lang.empty(); }

	/*
	* The effective datatype: the explicit one if present, else
	* rdf:langString for tagged literals, else xsd:string.
	*/
	IRI datatype() const;

	inline bool operator == (const Literal& other) const
	{
		return val == other.val && lang == other.lang && dtype == other.dtype;
	}
	inline bool operator != (const Literal& other) const { return !(*this == other); }
	inline bool operator < (const Literal& other) const
	{
		return std::tie(val, lang, dtype) < std::tie(other.val, other.lang, other.dtype);
	}
};


/*
* Sentinel graph name for the default (unnamed) graph.
*/
struct DefaultGraph
{
	inline bool operator == (const DefaultGraph&) const { return true; }
	inline bool operator != (const DefaultGraph&) const { return false; }
	inline bool operator < (const DefaultGraph&) const { return false; }
};


typedef std::variant<IRI, BlankNode> Subject;
typedef IRI Predicate;
typedef std::variant<IRI, BlankNode, Literal> Object;
typedef std::variant<DefaultGraph, IRI, BlankNode> GraphName;


struct Triple
{
	Subject sub;
	Predicate pred;
	Object obj;

	inline bool operator == (const Triple& other) const
	{
		return sub == other.sub && pred == other.pred && obj == other.obj;
	}
	inline bool operator != (const Triple& other) const { return !(*this == other); }
};


struct Quad
{
	Subject sub;
	Predicate pred;
	Object obj;
	GraphName graph;

	Triple triple() const { return Triple{ sub, pred, obj }; }

	inline bool operator == (const Quad& other) const
	{
		return sub == other.sub && pred == other.pred
			&& obj == other.obj && graph == other.graph;
	}
	inline bool operator != (const Quad& other) const { return !(*this == other); }
};


/*
* Literal constructors.
* `make_lang_literal` requires a nonempty language tag, and
* `make_typed_literal` requires a nonempty datatype which is not
* rdf:langString. A typed literal with datatype xsd:string is the
* same term as the corresponding plain literal.
*/
Literal make_literal(std::string val);
Literal make_lang_literal(std::string val, const std::string& lang);
Literal make_typed_literal(std::string val, const IRI& datatype);


Quad make_quad(const Triple& t, GraphName graph = DefaultGraph());


/*
* Escape a string for use inside the quotes of an N-Triples/N-Quads
* string literal, or inside the angle brackets of an IRIREF.
* If `ascii_only`, all non-ASCII code points are written as
* \uXXXX or \UXXXXXXXX escapes.
* Input is assumed to be valid UTF-8. Invalid bytes are written
* as U+FFFD.
*/
std::string escape_literal_value(const std::string& s, bool ascii_only);
std::string escape_iri(const std::string& s, bool ascii_only);


/*
* The canonical N-Quads string forms of terms (UTF-8, no
* relabelling of blank nodes). The default graph is the empty
* string. These strings define the canonical order of quads.
*/
struct NQuadsStringVisitor
{
	std::string operator()(const IRI& i) const;
	std::string operator()(const BlankNode& b) const;
	std::string operator()(const Literal& l) const;
	std::string operator()(const DefaultGraph&) const;
};


template<typename TermT>
std::string to_nquads_string(const TermT& t)
{
	return std::visit(NQuadsStringVisitor(), t);
}


inline std::string to_nquads_string(const IRI& i)
{
	return NQuadsStringVisitor()(i);
}


/*
* The full statement, as it appears in canonical N-Quads
* output (without the terminating " .").
*/
std::string to_nquads_string(const Quad& q);


}  // namespace rdfc


#endif  // RDFC_TYPES_H
