#include "rdfc_dictionary.h"
#include "rdfc_assert.h"


namespace rdfc
{


Dictionary::Code Dictionary::encode(const std::string& s)
{
	// if the string was new, this is what its new key would be
	const Code potential_new_code = m_decoder.size();

	// do a lookup, but insert if the string doesn't exist, with a new ID
	// (note that map's `insert` does not update the value if the key already
	// exists)
	auto [iter, is_new] = m_encoder.insert(std::make_pair(s, potential_new_code));

	if (is_new)
		// store address of iterator's key (NOT `s`)
		m_decoder.push_back(&iter->first);

	// when you decode the return value, it should give the input to this function
	RDFC_CHECK_INVARIANT(*m_decoder[iter->second] == s);

	return iter->second;
}


const std::string& Dictionary::decode(Code i) const
{
	RDFC_CHECK_PRECOND(i < m_decoder.size());
	return *m_decoder[i];
}


bool Dictionary::contains(const std::string& s) const
{
	return m_encoder.find(s) != m_encoder.end();
}


}  // namespace rdfc
