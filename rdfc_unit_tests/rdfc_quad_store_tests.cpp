#include <boost/test/unit_test.hpp>
#include "rdfc_quad_store.h"


using namespace rdfc;


namespace
{


Quad quad(const std::string& s, const std::string& p, const std::string& o,
    GraphName g = DefaultGraph())
{
    return Quad{ IRI{ s }, IRI{ p }, IRI{ o }, std::move(g) };
}


}  // namespace


BOOST_AUTO_TEST_SUITE(QuadStoreTests);


BOOST_AUTO_TEST_CASE(TestEmpty)
{
    QuadStore store;
    BOOST_CHECK(store.empty());
    BOOST_CHECK_EQUAL(store.size(), 0);
    BOOST_CHECK(store.graphs().empty());
    BOOST_CHECK(store.quads().empty());

    auto iter = store.scan();
    iter->start();
    BOOST_CHECK(!iter->valid());
}


BOOST_AUTO_TEST_CASE(TestAddIsIdempotent)
{
    QuadStore store;
    const Quad q = quad("http://s", "http://p", "http://o");

    BOOST_CHECK(store.add(q));
    BOOST_CHECK(!store.add(q));
    BOOST_CHECK_EQUAL(store.size(), 1);
    BOOST_CHECK(store.contains(q));
}


BOOST_AUTO_TEST_CASE(TestRemove)
{
    QuadStore store;
    const Quad q1 = quad("http://s", "http://p", "http://o");
    const Quad q2 = quad("http://s", "http://p", "http://o", IRI{ "http://g" });
    store.add(q1);
    store.add(q2);

    BOOST_CHECK(store.remove(q1));
    BOOST_CHECK(!store.remove(q1));
    BOOST_CHECK(!store.contains(q1));
    BOOST_CHECK(store.contains(q2));
    BOOST_CHECK_EQUAL(store.size(), 1);
}


BOOST_AUTO_TEST_CASE(TestLiteralsAreDistinct)
{
    QuadStore store;
    const Subject s = IRI{ "http://s" };
    const IRI p{ "http://p" };
    store.add(Quad{ s, p, make_literal("1"), DefaultGraph() });
    store.add(Quad{ s, p, make_lang_literal("1", "en"), DefaultGraph() });
    store.add(Quad{ s, p, make_typed_literal("1", IRI{ vocab::XSD_INTEGER }), DefaultGraph() });
    store.add(Quad{ s, p, make_typed_literal("1", IRI{ vocab::XSD_STRING }), DefaultGraph() });
    BOOST_CHECK_EQUAL(store.size(), 3);
}


BOOST_AUTO_TEST_CASE(TestCanonicalOrder)
{
    const Quad q1 = quad("http://b", "http://p", "http://o");
    const Quad q2 = quad("http://a", "http://p", "http://o", IRI{ "http://g" });
    const Quad q3 = quad("http://a", "http://p", "http://o");
    const Quad q4{ BlankNode{ "x" }, IRI{ "http://p" }, IRI{ "http://o" }, DefaultGraph() };

    QuadStore store;
    store.add(q4);
    store.add(q2);
    store.add(q1);
    store.add(q3);

    // default graph first, then IRIs before blank nodes
    const std::vector<Quad> expected = { q3, q1, q4, q2 };
    const std::vector<Quad> actual = store.quads();
    BOOST_REQUIRE_EQUAL(actual.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i)
        BOOST_CHECK_EQUAL(to_nquads_string(actual[i]), to_nquads_string(expected[i]));
}


BOOST_AUTO_TEST_CASE(TestGraphs)
{
    QuadStore store;
    store.add(quad("http://s", "http://p", "http://o", IRI{ "http://g2" }));
    store.add(quad("http://s", "http://p", "http://o", IRI{ "http://g1" }));
    store.add(quad("http://s", "http://p", "http://o2", IRI{ "http://g1" }));

    // no default graph unless something is in it
    std::vector<GraphName> graphs = store.graphs();
    BOOST_REQUIRE_EQUAL(graphs.size(), 2);
    BOOST_CHECK(graphs[0] == GraphName(IRI{ "http://g1" }));
    BOOST_CHECK(graphs[1] == GraphName(IRI{ "http://g2" }));

    store.add(quad("http://s", "http://p", "http://o"));
    graphs = store.graphs();
    BOOST_REQUIRE_EQUAL(graphs.size(), 3);
    BOOST_CHECK(graphs[0] == GraphName(DefaultGraph()));
}


BOOST_AUTO_TEST_CASE(TestQuadsInGraph)
{
    QuadStore store;
    store.add(quad("http://s", "http://p", "http://o"));
    store.add(quad("http://s", "http://p", "http://o1", IRI{ "http://g" }));
    store.add(quad("http://s", "http://p", "http://o2", IRI{ "http://g" }));
    store.add(quad("http://s", "http://p", "http://o3", IRI{ "http://h" }));

    BOOST_CHECK_EQUAL(store.quads(DefaultGraph()).size(), 1);
    BOOST_CHECK_EQUAL(store.quads(IRI{ "http://g" }).size(), 2);
    BOOST_CHECK_EQUAL(store.quads(IRI{ "http://h" }).size(), 1);
    BOOST_CHECK(store.quads(IRI{ "http://none" }).empty());
    BOOST_CHECK(store.quads(BlankNode{ "g" }).empty());
}


BOOST_AUTO_TEST_CASE(TestScan)
{
    QuadStore store;
    store.add(quad("http://s", "http://p", "http://o"));
    store.add(quad("http://s", "http://p", "http://o1", IRI{ "http://g" }));
    store.add(quad("http://s", "http://p", "http://o2", IRI{ "http://g" }));

    auto iter = store.scan(IRI{ "http://g" });

    // iterators start off invalid
    BOOST_CHECK(!iter->valid());

    iter->start();
    BOOST_REQUIRE(iter->valid());
    BOOST_CHECK(iter->current() == quad("http://s", "http://p", "http://o1", IRI{ "http://g" }));
    iter->next();
    BOOST_REQUIRE(iter->valid());
    BOOST_CHECK(iter->current() == quad("http://s", "http://p", "http://o2", IRI{ "http://g" }));
    iter->next();
    BOOST_CHECK(!iter->valid());

    // and can be restarted
    iter->start();
    BOOST_CHECK(iter->valid());

    size_t count = 0;
    auto all = store.scan();
    for (all->start(); all->valid(); all->next())
        ++count;
    BOOST_CHECK_EQUAL(count, 3);
}


BOOST_AUTO_TEST_CASE(TestInsertAndEquality)
{
    QuadStore a, b, c;
    a.add(quad("http://s", "http://p", "http://o1"));
    a.add(quad("http://s", "http://p", "http://o2"));

    b.add(quad("http://s", "http://p", "http://o2"));
    BOOST_CHECK(a != b);

    c.add(quad("http://s", "http://p", "http://o1"));
    b.insert(c);
    b.insert(c);
    BOOST_CHECK_EQUAL(b.size(), 2);
    BOOST_CHECK(a == b);
}


BOOST_AUTO_TEST_CASE(TestBlankNodesCompareByLabel)
{
    QuadStore a, b;
    a.add(Quad{ BlankNode{ "x" }, IRI{ "http://p" }, IRI{ "http://o" }, DefaultGraph() });
    b.add(Quad{ BlankNode{ "y" }, IRI{ "http://p" }, IRI{ "http://o" }, DefaultGraph() });
    BOOST_CHECK(a != b);
}


BOOST_AUTO_TEST_SUITE_END();
