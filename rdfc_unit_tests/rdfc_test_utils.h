#ifndef RDFC_TEST_UTILS_H
#define RDFC_TEST_UTILS_H


#include <map>
#include <set>
#include <string>
#include <vector>
#include <ostream>
#include <boost/test/unit_test.hpp>
#include "rdfc_lexer.h"
#include "rdfc_parser.h"
#include "rdfc_quad_store.h"


namespace rdfc
{


// for Boost's diagnostics
inline std::ostream& operator<<(std::ostream& os, TokenType type)
{
    return os << token_type_str(type);
}


inline std::ostream& operator<<(std::ostream& os, ErrorKind kind)
{
    return os << kind_str(kind);
}


namespace test
{


/*
* Parse `text`, failing the current test if that does not work.
*/
inline ParsedDocument parse_ok(const std::string& text, const ParseOptions& options = ParseOptions())
{
    ParseResult result = parse_document(std::string_view(text), options);
    if (const ParseError* e = std::get_if<ParseError>(&result))
        BOOST_FAIL("unexpected parse error: " + describe(*e));
    return std::get<ParsedDocument>(std::move(result));
}


/*
* Parse `text`, failing the current test if that works.
*/
inline ParseError parse_fail(const std::string& text, const ParseOptions& options = ParseOptions())
{
    ParseResult result = parse_document(std::string_view(text), options);
    BOOST_REQUIRE_MESSAGE(std::holds_alternative<ParseError>(result),
        "expected a parse error, but parsing succeeded");
    return std::get<ParseError>(result);
}


inline ParseOptions with_syntax(Syntax syntax)
{
    ParseOptions options;
    options.syntax = syntax;
    return options;
}


/*
* Decides whether two stores are equal up to a renaming of blank
* nodes, by backtracking search for a bijection. Only suitable
* for the small stores of unit tests.
*/
class IsomorphismChecker
{
public:
    IsomorphismChecker(const QuadStore& a, const QuadStore& b) :
        m_a(a.quads()),
        m_b(b.quads()),
        m_used(m_b.size(), false)
    { }

    bool check()
    {
        return m_a.size() == m_b.size() && match(0);
    }

private:
    bool match(size_t i)
    {
        if (i == m_a.size())
            return true;

        for (size_t j = 0; j < m_b.size(); ++j)
        {
            if (m_used[j])
                continue;

            std::vector<std::string> bound;
            if (bind_quad(m_a[i], m_b[j], bound))
            {
                m_used[j] = true;
                if (match(i + 1))
                    return true;
                m_used[j] = false;
            }

            // undo whatever this attempt bound
            for (const auto& label : bound)
            {
                m_inverse.erase(m_forward[label]);
                m_forward.erase(label);
            }
        }
        return false;
    }

    template<typename TermT>
    bool bind_term(const TermT& x, const TermT& y, std::vector<std::string>& bound)
    {
        const BlankNode* bx = std::get_if<BlankNode>(&x);
        const BlankNode* by = std::get_if<BlankNode>(&y);

        if (bx == nullptr || by == nullptr)
            return x == y;

        auto fwd = m_forward.find(bx->label);
        if (fwd != m_forward.end())
            return fwd->second == by->label;

        if (m_inverse.count(by->label) > 0)
            return false;

        m_forward[bx->label] = by->label;
        m_inverse[by->label] = bx->label;
        bound.push_back(bx->label);
        return true;
    }

    bool bind_quad(const Quad& x, const Quad& y, std::vector<std::string>& bound)
    {
        return x.pred == y.pred
            && bind_term(x.sub, y.sub, bound)
            && bind_term(x.obj, y.obj, bound)
            && bind_term(x.graph, y.graph, bound);
    }

private:
    const std::vector<Quad> m_a, m_b;
    std::vector<bool> m_used;
    std::map<std::string, std::string> m_forward, m_inverse;
};


inline bool isomorphic(const QuadStore& a, const QuadStore& b)
{
    return IsomorphismChecker(a, b).check();
}


inline std::set<std::string> blank_labels(const QuadStore& store)
{
    std::set<std::string> result;
    for (const Quad& q : store.quads())
    {
        if (const BlankNode* b = std::get_if<BlankNode>(&q.sub))
            result.insert(b->label);
        if (const BlankNode* b = std::get_if<BlankNode>(&q.obj))
            result.insert(b->label);
        if (const BlankNode* b = std::get_if<BlankNode>(&q.graph))
            result.insert(b->label);
    }
    return result;
}


}  // namespace test
}  // namespace rdfc


#endif  // RDFC_TEST_UTILS_H
