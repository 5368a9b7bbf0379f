#ifndef RDFC_DICTIONARY_H
#define RDFC_DICTIONARY_H


#include <vector>
#include <string>
#include <unordered_map>


namespace rdfc
{


/*
* This class encodes/decodes strings to/from integers.
* Strings are assigned new integer codes, counting up from
* zero, in the order in which they are first encountered.
* It is used to relabel blank nodes, both when parsing and
* when serializing.
*/
class Dictionary
{
public:
	typedef size_t Code;

	Code encode(const std::string& s);
	const std::string& decode(Code i) const;

	bool contains(const std::string& s) const;
	size_t size() const { return m_decoder.size(); }

private:
	std::unordered_map<std::string, Code> m_encoder;

	/*
	* Store pointers here rather than the strings, to prevent
	* duplication of memory by a factor of 2.
	* (note that `std::unordered_map` guarantees that elements'
	* pointers are never invalidated, even though their iterators
	* may be)
	*/
	std::vector<const std::string*> m_decoder;
};


}  // namespace rdfc


#endif  // RDFC_DICTIONARY_H
