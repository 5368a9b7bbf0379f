#ifndef RDFC_PARSE_CONTEXT_H
#define RDFC_PARSE_CONTEXT_H


#include <map>
#include <string>
#include <vector>
#include <optional>
#include "rdfc_types.h"
#include "rdfc_error.h"
#include "rdfc_dictionary.h"
#include "rdfc_quad_store.h"


namespace rdfc
{


enum class Syntax
{
	TURTLE,
	TRIG,  // Turtle plus named graph blocks
	N3,  // Turtle plus the N3 predicate shorthands
	NTRIPLES,
	NQUADS
};


enum class UnsupportedPolicy
{
	FAIL,  // the whole parse fails
	SKIP_STATEMENT  // drop the statement, record a warning, carry on
};


struct ParseOptions
{
	Syntax syntax = Syntax::TURTLE;

	// initial base IRI; empty means that relative IRIs cannot be resolved
	std::string base_iri;

	// the graph of every statement outside an explicit graph block
	GraphName graph = DefaultGraph();

	UnsupportedPolicy unsupported = UnsupportedPolicy::FAIL;

	/*
	* Every blank node produced by the parse gets a label starting
	* with this. If not given, a prefix unique within the process
	* is chosen, so that blank nodes from separate parses never
	* coincide.
	*/
	std::optional<std::string> blank_node_prefix;
};


/*
* The result of a successful parse: the statements, plus the
* base IRI and prefix table as they were at the end of the
* document.
*/
struct ParsedDocument
{
	QuadStore quads;
	std::string base;
	std::map<std::string, std::string> prefixes;

	// statements skipped under `UnsupportedPolicy::SKIP_STATEMENT`
	std::vector<ParseError> warnings;
};


/*
* Returns a blank node label prefix which has never been returned
* before by this process. Thread safe.
*/
std::string unique_blank_node_prefix();


/*
* The mutable state of one parse: base IRI, prefix table and the
* blank node labels seen so far. One context must not be shared
* between parses.
*/
class ParseContext
{
public:
	ParseContext(std::string base, std::string blank_node_prefix);

	const std::string& base() const { return m_base; }
	void set_base(std::string base) { m_base = std::move(base); }

	/*
	* Later bindings of the same prefix replace earlier ones.
	*/
	void set_prefix(const std::string& prefix, std::string iri);

	/*
	* The namespace IRI bound to `prefix`, or nullptr if the prefix
	* has not been declared.
	*/
	const std::string* find_prefix(const std::string& prefix) const;

	const std::map<std::string, std::string>& prefixes() const { return m_prefixes; }

	/*
	* Resolve `ref` against the current base. Returns std::nullopt
	* if `ref` is relative and no absolute base IRI is in scope.
	*/
	std::optional<std::string> resolve(const std::string& ref) const;

	/*
	* The blank node written as `_:label` in the document. The same
	* label always gives the same node within one context.
	*/
	BlankNode labelled_blank_node(const std::string& label);

	/*
	* A blank node distinct from every other node of this context.
	*/
	BlankNode fresh_blank_node();

private:
	std::string m_base;
	std::map<std::string, std::string> m_prefixes;
	const std::string m_blank_node_prefix;
	Dictionary m_labels;
	size_t m_next_fresh;
};


}  // namespace rdfc


#endif  // RDFC_PARSE_CONTEXT_H
