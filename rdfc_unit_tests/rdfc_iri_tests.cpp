#include <boost/test/unit_test.hpp>
#include "rdfc_iri.h"


using namespace rdfc;


namespace
{


const std::string RFC_BASE = "http://a/b/c/d;p?q";


std::string resolved(const std::string& ref)
{
    auto result = resolve_iri(RFC_BASE, ref);
    BOOST_REQUIRE(result.has_value());
    return *result;
}


}  // namespace


BOOST_AUTO_TEST_SUITE(IriTests);


BOOST_AUTO_TEST_CASE(TestSplitAndJoin)
{
    const IriParts parts = split_iri("http://example.org/a/b?x=1#frag");
    BOOST_REQUIRE(parts.scheme.has_value());
    BOOST_CHECK_EQUAL(*parts.scheme, "http");
    BOOST_REQUIRE(parts.authority.has_value());
    BOOST_CHECK_EQUAL(*parts.authority, "example.org");
    BOOST_CHECK_EQUAL(parts.path, "/a/b");
    BOOST_REQUIRE(parts.query.has_value());
    BOOST_CHECK_EQUAL(*parts.query, "x=1");
    BOOST_REQUIRE(parts.fragment.has_value());
    BOOST_CHECK_EQUAL(*parts.fragment, "frag");

    BOOST_CHECK_EQUAL(join_iri(parts), "http://example.org/a/b?x=1#frag");
}


BOOST_AUTO_TEST_CASE(TestEmptyQueryIsKept)
{
    const IriParts parts = split_iri("http://a/b?");
    BOOST_REQUIRE(parts.query.has_value());
    BOOST_CHECK(parts.query->empty());
    BOOST_CHECK(!parts.fragment.has_value());
    BOOST_CHECK_EQUAL(join_iri(parts), "http://a/b?");
}


BOOST_AUTO_TEST_CASE(TestHasScheme)
{
    BOOST_CHECK(has_scheme("http://a/b"));
    BOOST_CHECK(has_scheme("urn:isbn:123"));
    BOOST_CHECK(has_scheme("a+b-c.d:x"));
    BOOST_CHECK(!has_scheme("foo"));
    BOOST_CHECK(!has_scheme("/foo:bar"));
    BOOST_CHECK(!has_scheme("1a:b"));
    BOOST_CHECK(!has_scheme(""));
}


BOOST_AUTO_TEST_CASE(TestRemoveDotSegments)
{
    BOOST_CHECK_EQUAL(remove_dot_segments("/a/b/c/./../../g"), "/a/g");
    BOOST_CHECK_EQUAL(remove_dot_segments("mid/content=5/../6"), "mid/6");
    BOOST_CHECK_EQUAL(remove_dot_segments("/.."), "/");
    BOOST_CHECK_EQUAL(remove_dot_segments(""), "");
}


BOOST_AUTO_TEST_CASE(TestNormalExamples)
{
    // RFC 3986 section 5.4.1
    BOOST_CHECK_EQUAL(resolved("g:h"), "g:h");
    BOOST_CHECK_EQUAL(resolved("g"), "http://a/b/c/g");
    BOOST_CHECK_EQUAL(resolved("./g"), "http://a/b/c/g");
    BOOST_CHECK_EQUAL(resolved("g/"), "http://a/b/c/g/");
    BOOST_CHECK_EQUAL(resolved("/g"), "http://a/g");
    BOOST_CHECK_EQUAL(resolved("//g"), "http://g");
    BOOST_CHECK_EQUAL(resolved("?y"), "http://a/b/c/d;p?y");
    BOOST_CHECK_EQUAL(resolved("g?y"), "http://a/b/c/g?y");
    BOOST_CHECK_EQUAL(resolved("#s"), "http://a/b/c/d;p?q#s");
    BOOST_CHECK_EQUAL(resolved("g#s"), "http://a/b/c/g#s");
    BOOST_CHECK_EQUAL(resolved("g?y#s"), "http://a/b/c/g?y#s");
    BOOST_CHECK_EQUAL(resolved(";x"), "http://a/b/c/;x");
    BOOST_CHECK_EQUAL(resolved("g;x"), "http://a/b/c/g;x");
    BOOST_CHECK_EQUAL(resolved(""), "http://a/b/c/d;p?q");
    BOOST_CHECK_EQUAL(resolved("."), "http://a/b/c/");
    BOOST_CHECK_EQUAL(resolved("./"), "http://a/b/c/");
    BOOST_CHECK_EQUAL(resolved(".."), "http://a/b/");
    BOOST_CHECK_EQUAL(resolved("../"), "http://a/b/");
    BOOST_CHECK_EQUAL(resolved("../g"), "http://a/b/g");
    BOOST_CHECK_EQUAL(resolved("../.."), "http://a/");
    BOOST_CHECK_EQUAL(resolved("../../"), "http://a/");
    BOOST_CHECK_EQUAL(resolved("../../g"), "http://a/g");
}


BOOST_AUTO_TEST_CASE(TestAbnormalExamples)
{
    // RFC 3986 section 5.4.2
    BOOST_CHECK_EQUAL(resolved("../../../g"), "http://a/g");
    BOOST_CHECK_EQUAL(resolved("../../../../g"), "http://a/g");
    BOOST_CHECK_EQUAL(resolved("/./g"), "http://a/g");
    BOOST_CHECK_EQUAL(resolved("/../g"), "http://a/g");
    BOOST_CHECK_EQUAL(resolved("g."), "http://a/b/c/g.");
    BOOST_CHECK_EQUAL(resolved(".g"), "http://a/b/c/.g");
    BOOST_CHECK_EQUAL(resolved("g.."), "http://a/b/c/g..");
    BOOST_CHECK_EQUAL(resolved("..g"), "http://a/b/c/..g");
    BOOST_CHECK_EQUAL(resolved("./../g"), "http://a/b/g");
    BOOST_CHECK_EQUAL(resolved("./g/."), "http://a/b/c/g/");
    BOOST_CHECK_EQUAL(resolved("g/./h"), "http://a/b/c/g/h");
    BOOST_CHECK_EQUAL(resolved("g/../h"), "http://a/b/c/h");
    BOOST_CHECK_EQUAL(resolved("g;x=1/./y"), "http://a/b/c/g;x=1/y");
    BOOST_CHECK_EQUAL(resolved("g;x=1/../y"), "http://a/b/c/y");
    BOOST_CHECK_EQUAL(resolved("g?y/./x"), "http://a/b/c/g?y/./x");
    BOOST_CHECK_EQUAL(resolved("g#s/../x"), "http://a/b/c/g#s/../x");
}


BOOST_AUTO_TEST_CASE(TestAbsoluteReferenceUnchanged)
{
    // dot segments in an absolute reference are left alone
    auto result = resolve_iri(RFC_BASE, "http://x/a/../b");
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, "http://x/a/../b");

    result = resolve_iri("", "urn:x");
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, "urn:x");
}


BOOST_AUTO_TEST_CASE(TestBaseWithoutPath)
{
    auto result = resolve_iri("http://example.org", "foo");
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, "http://example.org/foo");
}


BOOST_AUTO_TEST_CASE(TestNoUsableBase)
{
    BOOST_CHECK(!resolve_iri("", "foo").has_value());
    BOOST_CHECK(!resolve_iri("relative/base", "foo").has_value());
    BOOST_CHECK(!resolve_iri("", "#frag").has_value());
}


BOOST_AUTO_TEST_CASE(TestIriCharsAllowed)
{
    BOOST_CHECK(iri_chars_allowed("http://example.org/a%20b?x=1#y"));
    BOOST_CHECK(iri_chars_allowed("http://example.org/caf\xC3\xA9"));
    BOOST_CHECK(iri_chars_allowed(""));
    BOOST_CHECK(!iri_chars_allowed("file:///my data/x.ttl"));
    BOOST_CHECK(!iri_chars_allowed("http://e/a\tb"));
    BOOST_CHECK(!iri_chars_allowed("http://e/{x}"));
    BOOST_CHECK(!iri_chars_allowed("http://e/a\\b"));
}


BOOST_AUTO_TEST_CASE(TestFileIri)
{
    BOOST_CHECK_EQUAL(file_iri("/home/u/x.ttl"), "file:///home/u/x.ttl");
    BOOST_CHECK_EQUAL(file_iri("/home/u/my data/x.ttl"), "file:///home/u/my%20data/x.ttl");

    // characters which would change the meaning of the IRI
    BOOST_CHECK_EQUAL(file_iri("/a/50%/b#c?d"), "file:///a/50%25/b%23c%3Fd");
    BOOST_CHECK_EQUAL(file_iri("/caf\xC3\xA9"), "file:///caf%C3%A9");
    BOOST_CHECK_EQUAL(file_iri("/a-b_c.d~e/(1)+@:=,!"), "file:///a-b_c.d~e/(1)+@:=,!");
    BOOST_CHECK_EQUAL(file_iri("C:/x y"), "file:///C:/x%20y");

    BOOST_CHECK(iri_chars_allowed(file_iri("/a <b> \"c\" {d}|^`\\")));
}


BOOST_AUTO_TEST_SUITE_END();
