#include <sstream>
#include <boost/test/unit_test.hpp>
#include "rdfc_serializer.h"
#include "rdfc_parser.h"
#include "rdfc_iri.h"
#include "rdfc_test_utils.h"


using namespace rdfc;
using namespace rdfc::test;


namespace
{


std::string to_nquads(const QuadStore& store, const SerializerOptions& options = SerializerOptions())
{
    std::stringstream out;
    const size_t n = serialize_nquads(store, out, options);
    BOOST_CHECK_EQUAL(n, store.size());
    return out.str();
}


// serialize, then parse the output back in
QuadStore round_trip(const QuadStore& store)
{
    return parse_ok(to_nquads(store), with_syntax(Syntax::NQUADS)).quads;
}


const std::string MIXED_DOCUMENT =
    "@prefix : <http://example.org/> .\n"
    "@prefix xsd: <http://www.w3.org/2001/XMLSchema#> .\n"
    ":alice a :Person ;\n"
    "    :name \"Alice \\\"Al\\\" Smith\"@EN ;\n"
    "    :age 42 ;\n"
    "    :height 1.68 ;\n"
    "    :knows [ :name \"B\\u00F6b\" ; :knows _:carol ] ;\n"
    "    :likes ( :tea \"coffee\" ( 1 2 ) ) ;\n"
    "    :bio \"\"\"line one\n"
    "line\ttwo\\\\\"\"\" .\n"
    "_:carol :knows :alice ;\n"
    "    :score \"9.5\"^^xsd:double, \"x\"^^xsd:string .\n";


}  // namespace


BOOST_AUTO_TEST_SUITE(SerializerTests);


BOOST_AUTO_TEST_CASE(TestEmptyStore)
{
    BOOST_CHECK_EQUAL(to_nquads(QuadStore()), "");
}


BOOST_AUTO_TEST_CASE(TestSimpleOutput)
{
    QuadStore store;
    store.add(Quad{ IRI{ "http://ex/s" }, IRI{ "http://ex/p" }, IRI{ "http://ex/o" }, IRI{ "http://ex/g" } });
    store.add(Quad{ IRI{ "http://ex/s" }, IRI{ "http://ex/p" }, make_literal("a\"b\n"), DefaultGraph() });

    // default graph first, and no graph term for it
    BOOST_CHECK_EQUAL(to_nquads(store),
        "<http://ex/s> <http://ex/p> \"a\\\"b\\n\" .\n"
        "<http://ex/s> <http://ex/p> <http://ex/o> <http://ex/g> .\n");
}


BOOST_AUTO_TEST_CASE(TestLiteralForms)
{
    QuadStore store;
    const Subject s = IRI{ "http://s" };
    const IRI p{ "http://p" };
    store.add(Quad{ s, p, make_lang_literal("x", "en"), DefaultGraph() });
    store.add(Quad{ s, p, make_typed_literal("1", IRI{ vocab::XSD_INTEGER }), DefaultGraph() });
    store.add(Quad{ s, p, make_typed_literal("y", IRI{ vocab::XSD_STRING }), DefaultGraph() });

    BOOST_CHECK_EQUAL(to_nquads(store),
        "<http://s> <http://p> \"1\"^^<http://www.w3.org/2001/XMLSchema#integer> .\n"
        "<http://s> <http://p> \"x\"@en .\n"
        "<http://s> <http://p> \"y\" .\n");
}


BOOST_AUTO_TEST_CASE(TestBlankNodesRelabelled)
{
    QuadStore store;
    store.add(Quad{ BlankNode{ "zzz" }, IRI{ "http://p" }, IRI{ "http://o" }, DefaultGraph() });
    store.add(Quad{ BlankNode{ "aaa" }, IRI{ "http://p" }, IRI{ "http://o" }, DefaultGraph() });

    BOOST_CHECK_EQUAL(to_nquads(store),
        "_:b0 <http://p> <http://o> .\n"
        "_:b1 <http://p> <http://o> .\n");
}


BOOST_AUTO_TEST_CASE(TestBlankNodeLabelsConsistent)
{
    QuadStore store;
    store.add(Quad{ BlankNode{ "x" }, IRI{ "http://p" }, BlankNode{ "y" }, DefaultGraph() });
    store.add(Quad{ BlankNode{ "y" }, IRI{ "http://p" }, BlankNode{ "x" }, BlankNode{ "x" } });

    BOOST_CHECK_EQUAL(to_nquads(store),
        "_:b0 <http://p> _:b1 .\n"
        "_:b1 <http://p> _:b0 _:b0 .\n");
}


BOOST_AUTO_TEST_CASE(TestAsciiOnly)
{
    QuadStore store;
    store.add(Quad{ IRI{ "http://e/caf\xC3\xA9" }, IRI{ "http://p" }, make_literal("caf\xC3\xA9"), DefaultGraph() });

    BOOST_CHECK_EQUAL(to_nquads(store),
        "<http://e/caf\\u00E9> <http://p> \"caf\\u00E9\" .\n");

    SerializerOptions options;
    options.ascii_only = false;
    BOOST_CHECK_EQUAL(to_nquads(store, options),
        "<http://e/caf\xC3\xA9> <http://p> \"caf\xC3\xA9\" .\n");
}


BOOST_AUTO_TEST_CASE(TestWriterStatement)
{
    NQuadsWriter writer{ SerializerOptions() };
    const Quad q{ BlankNode{ "n" }, IRI{ "http://p" }, make_literal("o"), IRI{ "http://g" } };
    BOOST_CHECK_EQUAL(writer.statement(q, true), "_:b0 <http://p> \"o\" <http://g> .");
    BOOST_CHECK_EQUAL(writer.statement(q, false), "_:b0 <http://p> \"o\" .");
}


BOOST_AUTO_TEST_CASE(TestNTriples)
{
    QuadStore store;
    store.add(Quad{ IRI{ "http://s" }, IRI{ "http://p" }, IRI{ "http://o" }, DefaultGraph() });
    store.add(Quad{ IRI{ "http://s" }, IRI{ "http://p" }, IRI{ "http://o" }, IRI{ "http://g" } });
    store.add(Quad{ IRI{ "http://s" }, IRI{ "http://p" }, IRI{ "http://o2" }, IRI{ "http://g" } });

    std::stringstream out;
    BOOST_CHECK_EQUAL(serialize_ntriples(store, out), 2);
    BOOST_CHECK_EQUAL(out.str(),
        "<http://s> <http://p> <http://o> .\n"
        "<http://s> <http://p> <http://o2> .\n");
}


BOOST_AUTO_TEST_CASE(TestOutputIsDeterministic)
{
    ParseOptions options;
    options.blank_node_prefix = "t";
    const QuadStore store = parse_ok(MIXED_DOCUMENT, options).quads;

    BOOST_CHECK_EQUAL(to_nquads(store), to_nquads(store));

    // insertion order does not matter
    QuadStore reversed;
    const auto quads = store.quads();
    for (auto iter = quads.rbegin(); iter != quads.rend(); ++iter)
        reversed.add(*iter);
    BOOST_CHECK_EQUAL(to_nquads(reversed), to_nquads(store));
}


BOOST_AUTO_TEST_CASE(TestRoundTrip)
{
    const QuadStore store = parse_ok(MIXED_DOCUMENT).quads;
    BOOST_CHECK_EQUAL(store.size(), 22);

    const QuadStore reparsed = round_trip(store);
    BOOST_CHECK_EQUAL(reparsed.size(), store.size());
    BOOST_CHECK(isomorphic(store, reparsed));
}


BOOST_AUTO_TEST_CASE(TestRoundTripNamedGraphs)
{
    const QuadStore store = parse_ok(
        "@prefix : <http://example.org/> .\n"
        ":s :p :o .\n"
        ":g { :s :p \"in g\" . _:x :p ( :a ) }\n"
        "_:h { _:x :p :o }\n"
        "[] { :s :p [] }\n",
        with_syntax(Syntax::TRIG)).quads;

    const QuadStore reparsed = round_trip(store);
    BOOST_CHECK_EQUAL(reparsed.graphs().size(), store.graphs().size());
    BOOST_CHECK(isomorphic(store, reparsed));
}


BOOST_AUTO_TEST_CASE(TestRoundTripAwkwardStrings)
{
    const std::string awkward = std::string("tab\there \"quoted\" back\\slash\r\n")
        + std::string("\x01\x7F", 2) + "\xE2\x82\xAC\xF0\x9F\x98\x80";

    QuadStore store;
    store.add(Quad{ IRI{ "http://s" }, IRI{ "http://p" }, make_literal(awkward), DefaultGraph() });
    store.add(Quad{ IRI{ "http://s" }, IRI{ "http://p" }, make_lang_literal(awkward, "de-ch"), DefaultGraph() });
    store.add(Quad{ IRI{ "http://s/\xC3\xA9t\xC3\xA9" }, IRI{ "http://p" }, IRI{ "http://o" }, DefaultGraph() });

    for (bool ascii_only : { true, false })
    {
        SerializerOptions options;
        options.ascii_only = ascii_only;
        const QuadStore reparsed = parse_ok(to_nquads(store, options), with_syntax(Syntax::NQUADS)).quads;
        BOOST_CHECK(reparsed == store);
    }
}


BOOST_AUTO_TEST_CASE(TestRoundTripFileBase)
{
    // the base a file in a directory with a space in its name gets
    ParseOptions options;
    options.base_iri = file_iri("/home/user/my data/x.ttl");
    options.graph = IRI{ "http://ex/g" };
    const QuadStore store = parse_ok("<a> <b> <c> .\n<#d> <b> \"e\" .", options).quads;

    const std::string out = to_nquads(store);
    BOOST_CHECK_EQUAL(out,
        "<file:///home/user/my%20data/a> <file:///home/user/my%20data/b> "
        "<file:///home/user/my%20data/c> <http://ex/g> .\n"
        "<file:///home/user/my%20data/x.ttl#d> <file:///home/user/my%20data/b> "
        "\"e\" <http://ex/g> .\n");
    BOOST_CHECK(round_trip(store) == store);
}


BOOST_AUTO_TEST_SUITE_END();
