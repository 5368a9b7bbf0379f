#ifndef RDFC_QUAD_STORE_H
#define RDFC_QUAD_STORE_H


#include <map>
#include <array>
#include <vector>
#include <memory>
#include <string>
#include "rdfc_types.h"
#include "rdfc_iterator.h"


namespace rdfc
{


/*
* An in-memory set of quads.
* Quads are kept in canonical order: lexicographic on the
* canonical N-Quads strings of (graph, subject, predicate, object),
* where the default graph is the empty string and hence comes
* first. All of the functions below which return several quads
* return them in this order.
*
* Not safe for concurrent mutation. Readers may share a store
* as long as nobody writes to it.
*/
class QuadStore
{
public:
	/*
	* Insert `q`. Returns true if it was not already present.
	* Adding a duplicate is a no-op.
	*/
	bool add(const Quad& q);

	/*
	* Remove `q`. Returns true if it was present.
	* WARNING: invalidates any alive iterator positioned at `q`.
	*/
	bool remove(const Quad& q);

	bool contains(const Quad& q) const;

	size_t size() const { return m_quads.size(); }
	bool empty() const { return m_quads.empty(); }

	/*
	* The distinct graph names of the quads in the store.
	* The default graph is included iff some quad is in it.
	*/
	std::vector<GraphName> graphs() const;

	std::vector<Quad> quads() const;
	std::vector<Quad> quads(const GraphName& graph) const;

	/*
	* Create an iterator over the whole store, or over one graph.
	* The store must outlive the iterator, and must not be
	* modified while the iterator is in use.
	*/
	std::unique_ptr<IQuadIterator> scan() const;
	std::unique_ptr<IQuadIterator> scan(const GraphName& graph) const;

	/*
	* Add every quad of `other` to this store.
	*/
	void insert(const QuadStore& other);

	/*
	* Set equality. Blank nodes are compared by label, so two
	* isomorphic stores with different labels are not equal.
	*/
	bool operator == (const QuadStore& other) const;
	bool operator != (const QuadStore& other) const { return !(*this == other); }

private:
	// (graph, subject, predicate, object) canonical strings
	typedef std::array<std::string, 4> Key;
	typedef std::map<Key, Quad> Map;

	static Key make_key(const Quad& q);

	// the range of quads in the given graph
	std::pair<Map::const_iterator, Map::const_iterator> graph_range(const GraphName& graph) const;

	class StoreIterator;

private:
	Map m_quads;
};


}  // namespace rdfc


#endif  // RDFC_QUAD_STORE_H
