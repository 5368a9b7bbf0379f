#ifndef RDFC_NQUADS_H
#define RDFC_NQUADS_H


#include <string_view>
#include "rdfc_types.h"
#include "rdfc_parse_context.h"
#include "rdfc_token_stream.h"


namespace rdfc
{


/*
* Parser for the line based formats N-Triples and N-Quads.
* Every IRI must be absolute, and there are no prefixes or
* abbreviations. N-Triples documents may not name graphs.
*
* Behaviour on errors: as for `TurtleParser`, except that these
* formats have no unsupported constructs.
*/
class NQuadsParser
{
public:
	/*
	* `text` must remain alive until `parse` returns.
	* Precondition: the syntax is N-Triples or N-Quads.
	*/
	NQuadsParser(std::string_view text, const ParseOptions& options);

	ParsedDocument parse();

private:
	void statement();
	Subject subject();
	IRI iri();
	Object object();
	GraphName graph_label();

private:
	TokenStream m_tokens;
	const ParseOptions m_options;
	ParseContext m_ctx;
	ParsedDocument m_doc;
};


}  // namespace rdfc


#endif  // RDFC_NQUADS_H
