#ifndef RDFC_TURTLE_H
#define RDFC_TURTLE_H


#include <string_view>
#include <vector>
#include "rdfc_types.h"
#include "rdfc_parse_context.h"
#include "rdfc_token_stream.h"


namespace rdfc
{


/*
* Recursive descent parser for Turtle, TriG and the parts of N3
* which can be represented as quads.
*
* Statements are collected per top-level statement (or per
* statement of a graph block) and only added to the store once
* the statement is complete.
*
* Behaviour on errors:
* `parse` throws `ParseFailure` on the first error, except for
* unsupported constructs under `UnsupportedPolicy::SKIP_STATEMENT`,
* which are recorded as warnings. Nothing is recovered from a
* failed parse. Most users want `parse_document` instead, which
* does not throw.
*/
class TurtleParser
{
public:
	/*
	* `text` must remain alive until `parse` returns.
	* Precondition: the syntax is Turtle, TriG or N3.
	*/
	TurtleParser(std::string_view text, const ParseOptions& options);

	/*
	* Parse the whole document. May only be called once.
	*/
	ParsedDocument parse();

private:
	void statement();
	void directive();
	void prefix_id();
	void base();
	void wrapped_graph(GraphName graph);
	void triples();
	void predicate_object_list(const Subject& subject);
	void object_list(const Subject& subject, const IRI& predicate, bool reversed);

	Subject subject();
	IRI verb(bool& out_reversed);
	Object object();
	IRI iri();
	Literal literal();
	BlankNode blank_node_property_list();
	Subject collection();
	GraphName graph_label();

	bool at_verb();
	void check_no_path();
	void emit(const Subject& s, const IRI& p, const Object& o);

	/*
	* Add the pending statements to the store.
	*/
	void commit();

	/*
	* Called from a `catch` block. Rethrows unless `e` is an
	* unsupported construct which we are allowed to skip, in which
	* case the pending statements are dropped and the tokens are
	* skipped up to the end of the statement which began at nesting
	* depth `start_depth`.
	* If `brace_ends`, a closing brace back at that depth also ends
	* the statement (a whole graph block is being skipped).
	*/
	void skip_or_rethrow(const ParseFailure& e, int start_depth, bool brace_ends);

	[[noreturn]] void unsupported(const std::string& what, const Token& at) const;

private:
	TokenStream m_tokens;
	const ParseOptions m_options;
	ParseContext m_ctx;
	ParsedDocument m_doc;
	GraphName m_graph;
	std::vector<Quad> m_pending;
};


}  // namespace rdfc


#endif  // RDFC_TURTLE_H
