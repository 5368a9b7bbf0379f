#include "rdfc_quad_store.h"
#include "rdfc_assert.h"


namespace rdfc
{


/*
* Iterates over a contiguous range of the store's map.
*/
class QuadStore::StoreIterator :
	public IQuadIterator
{
public:
	StoreIterator(Map::const_iterator begin, Map::const_iterator end) :
		m_begin(begin),
		m_end(end),
		m_cur(end)
	{ }

	void start() override
	{
		m_cur = m_begin;
	}

	Quad current() const override
	{
		RDFC_CHECK_PRECOND(valid());
		return m_cur->second;
	}

	void next() override
	{
		RDFC_CHECK_PRECOND(valid());
		++m_cur;
	}

	bool valid() const override
	{
		return m_cur != m_end;
	}

private:
	const Map::const_iterator m_begin, m_end;
	Map::const_iterator m_cur;
};


bool QuadStore::add(const Quad& q)
{
	// don't insert duplicates!
	return m_quads.emplace(make_key(q), q).second;
}


bool QuadStore::remove(const Quad& q)
{
	return m_quads.erase(make_key(q)) > 0;
}


bool QuadStore::contains(const Quad& q) const
{
	return m_quads.find(make_key(q)) != m_quads.end();
}


std::vector<GraphName> QuadStore::graphs() const
{
	std::vector<GraphName> result;

	// quads are grouped by graph, so we only need to look for
	// the points where the graph changes
	const std::string* last = nullptr;
	for (const auto& [key, q] : m_quads)
	{
		if (last == nullptr || *last != key[0])
		{
			result.push_back(q.graph);
			last = &key[0];
		}
	}

	return result;
}


std::vector<Quad> QuadStore::quads() const
{
	std::vector<Quad> result;
	result.reserve(m_quads.size());
	for (const auto& entry : m_quads)
		result.push_back(entry.second);
	return result;
}


std::vector<Quad> QuadStore::quads(const GraphName& graph) const
{
	std::vector<Quad> result;
	auto [begin, end] = graph_range(graph);
	for (auto iter = begin; iter != end; ++iter)
		result.push_back(iter->second);
	return result;
}


std::unique_ptr<IQuadIterator> QuadStore::scan() const
{
	return std::make_unique<StoreIterator>(m_quads.cbegin(), m_quads.cend());
}


std::unique_ptr<IQuadIterator> QuadStore::scan(const GraphName& graph) const
{
	auto [begin, end] = graph_range(graph);
	return std::make_unique<StoreIterator>(begin, end);
}


void QuadStore::insert(const QuadStore& other)
{
	m_quads.insert(other.m_quads.begin(), other.m_quads.end());
}


bool QuadStore::operator == (const QuadStore& other) const
{
	if (m_quads.size() != other.m_quads.size())
		return false;

	auto iter = other.m_quads.begin();
	for (const auto& entry : m_quads)
	{
		if (entry.first != iter->first)
			return false;
		++iter;
	}
	return true;
}


QuadStore::Key QuadStore::make_key(const Quad& q)
{
	return Key{ to_nquads_string(q.graph), to_nquads_string(q.sub),
		to_nquads_string(q.pred), to_nquads_string(q.obj) };
}


std::pair<QuadStore::Map::const_iterator, QuadStore::Map::const_iterator>
QuadStore::graph_range(const GraphName& graph) const
{
	// the empty string sorts before every other string, so this is
	// the smallest possible key in the graph
	const Key lowest{ to_nquads_string(graph), std::string(), std::string(), std::string() };

	auto begin = m_quads.lower_bound(lowest);
	auto end = begin;
	while (end != m_quads.end() && end->first[0] == lowest[0])
		++end;

	return std::make_pair(begin, end);
}


}  // namespace rdfc
