#include <atomic>
#include "rdfc_parse_context.h"
#include "rdfc_iri.h"


namespace rdfc
{


std::string unique_blank_node_prefix()
{
	static std::atomic<unsigned long long> next_document(0);
	return 'd' + std::to_string(next_document++) + '_';
}


ParseContext::ParseContext(std::string base, std::string blank_node_prefix) :
	m_base(std::move(base)),
	m_blank_node_prefix(std::move(blank_node_prefix)),
	m_next_fresh(0)
{ }


void ParseContext::set_prefix(const std::string& prefix, std::string iri)
{
	m_prefixes[prefix] = std::move(iri);
}


const std::string* ParseContext::find_prefix(const std::string& prefix) const
{
	auto iter = m_prefixes.find(prefix);
	if (iter == m_prefixes.end())
		return nullptr;
	return &iter->second;
}


std::optional<std::string> ParseContext::resolve(const std::string& ref) const
{
	return resolve_iri(m_base, ref);
}


BlankNode ParseContext::labelled_blank_node(const std::string& label)
{
	// labelled and fresh nodes are told apart by the letter after the prefix
	return BlankNode{ m_blank_node_prefix + 'b' + std::to_string(m_labels.encode(label)) };
}


BlankNode ParseContext::fresh_blank_node()
{
	return BlankNode{ m_blank_node_prefix + 'g' + std::to_string(m_next_fresh++) };
}


}  // namespace rdfc
