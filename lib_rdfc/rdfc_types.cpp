#include <cstdio>
#include "rdfc_types.h"
#include "rdfc_utf8.h"
#include "rdfc_assert.h"


namespace rdfc
{


namespace
{


void append_uchar(std::string& out, char32_t cp)
{
	char buf[12];
	if (cp <= 0xFFFF)
		std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(cp));
	else
		std::snprintf(buf, sizeof(buf), "\\U%08X", static_cast<unsigned>(cp));
	out += buf;
}


/*
* Walks `s` by code point, calling `escape(out, cp)` for each
* one. If it returns false, the code point is copied through
* (or written as a UCHAR, if it is non-ASCII and `ascii_only`).
*/
template<typename EscapeFn>
std::string escape_with(const std::string& s, bool ascii_only, EscapeFn escape)
{
	std::string out;
	out.reserve(s.size() + 2);

	size_t pos = 0;
	while (pos < s.size())
	{
		char32_t cp;
		size_t len;
		if (!decode_utf8(s, pos, cp, len))
		{
			cp = 0xFFFD;
			len = 1;
		}

		if (!escape(out, cp))
		{
			if (cp >= 0x80 && ascii_only)
				append_uchar(out, cp);
			else
				append_utf8(out, cp);
		}
		pos += len;
	}

	return out;
}


}  // namespace


IRI Literal::datatype() const
{
	if (!dtype.empty())
		return IRI{ dtype };
	else if (has_lang())
		return IRI{ vocab::RDF_LANG_STRING };
	else
		return IRI{ vocab::XSD_STRING };
}


Literal make_literal(std::string val)
{
	return Literal{ std::move(val), std::string(), std::string() };
}


Literal make_lang_literal(std::string val, const std::string& lang)
{
	RDFC_CHECK_PRECOND(!lang.empty());

	std::string lower(lang);
	for (char& c : lower)
	{
		if (c >= 'A' && c <= 'Z')
			c = static_cast<char>(c - 'A' + 'a');
	}

	return Literal{ std::move(val), std::move(lower), std::string() };
}


Literal make_typed_literal(std::string val, const IRI& datatype)
{
	RDFC_CHECK_PRECOND(!datatype.val.empty());
	RDFC_CHECK_PRECOND(datatype.val != vocab::RDF_LANG_STRING);

	if (datatype.val == vocab::XSD_STRING)
		return make_literal(std::move(val));

	return Literal{ std::move(val), std::string(), datatype.val };
}


Quad make_quad(const Triple& t, GraphName graph)
{
	return Quad{ t.sub, t.pred, t.obj, std::move(graph) };
}


std::string escape_literal_value(const std::string& s, bool ascii_only)
{
	return escape_with(s, ascii_only, [](std::string& out, char32_t cp)
		{
			switch (cp)
			{
			case '"': out += "\\\""; return true;
			case '\\': out += "\\\\"; return true;
			case '\n': out += "\\n"; return true;
			case '\r': out += "\\r"; return true;
			case '\t': out += "\\t"; return true;
			case '\b': out += "\\b"; return true;
			case '\f': out += "\\f"; return true;
			default:
				if (cp < 0x20 || cp == 0x7F)
				{
					append_uchar(out, cp);
					return true;
				}
				return false;
			}
		});
}


std::string escape_iri(const std::string& s, bool ascii_only)
{
	return escape_with(s, ascii_only, [](std::string& out, char32_t cp)
		{
			switch (cp)
			{
			case '<': case '>': case '"': case '{': case '}':
			case '|': case '^': case '`': case '\\':
				append_uchar(out, cp);
				return true;
			default:
				if (cp <= 0x20)
				{
					append_uchar(out, cp);
					return true;
				}
				return false;
			}
		});
}


std::string NQuadsStringVisitor::operator()(const IRI& i) const
{
	return '<' + escape_iri(i.val, false) + '>';
}


std::string NQuadsStringVisitor::operator()(const BlankNode& b) const
{
	return "_:" + b.label;
}


std::string NQuadsStringVisitor::operator()(const Literal& l) const
{
	std::string result = '"' + escape_literal_value(l.val, false) + '"';
	if (l.has_lang())
		result += '@' + l.lang;
	else if (!l.dtype.empty())
		result += "^^" + (*this)(IRI{ l.dtype });
	return result;
}


std::string NQuadsStringVisitor::operator()(const DefaultGraph&) const
{
	return std::string();
}


std::string to_nquads_string(const Quad& q)
{
	std::string result = to_nquads_string(q.sub) + ' '
		+ to_nquads_string(q.pred) + ' '
		+ to_nquads_string(q.obj);
	if (!std::holds_alternative<DefaultGraph>(q.graph))
		result += ' ' + to_nquads_string(q.graph);
	return result;
}


}  // namespace rdfc
