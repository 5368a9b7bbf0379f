#include "rdfc_iri.h"


namespace rdfc
{


namespace
{


bool is_alpha(char c)
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}


bool is_unreserved(char c)
{
	return is_alpha(c) || (c >= '0' && c <= '9') || c == '-' || c == '.'
		|| c == '_' || c == '~';
}


// the characters of an RFC 3986 path segment besides the
// unreserved ones
bool is_sub_delim_or_pchar(char c)
{
	return c == '!' || c == '$' || c == '&' || c == '\'' || c == '(' || c == ')'
		|| c == '*' || c == '+' || c == ',' || c == ';' || c == '=' || c == ':'
		|| c == '@';
}


bool is_scheme_char(char c)
{
	return is_alpha(c) || (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}


// length of the scheme at the start of `iri`, excluding the
// colon, or 0 if there is none
size_t scheme_length(const std::string& iri)
{
	if (iri.empty() || !is_alpha(iri[0]))
		return 0;

	size_t i = 1;
	while (i < iri.size() && is_scheme_char(iri[i]))
		++i;

	return (i < iri.size() && iri[i] == ':') ? i : 0;
}


std::string merge_paths(const IriParts& base, const std::string& ref_path)
{
	if (base.authority && base.path.empty())
		return '/' + ref_path;

	const auto last_slash = base.path.rfind('/');
	if (last_slash == std::string::npos)
		return ref_path;
	return base.path.substr(0, last_slash + 1) + ref_path;
}


}  // namespace


IriParts split_iri(const std::string& iri)
{
	IriParts parts;
	size_t pos = 0;

	const size_t scheme_len = scheme_length(iri);
	if (scheme_len > 0)
	{
		parts.scheme = iri.substr(0, scheme_len);
		pos = scheme_len + 1;
	}

	if (iri.compare(pos, 2, "//") == 0)
	{
		const size_t auth_end = iri.find_first_of("/?#", pos + 2);
		const size_t end = (auth_end == std::string::npos) ? iri.size() : auth_end;
		parts.authority = iri.substr(pos + 2, end - pos - 2);
		pos = end;
	}

	const size_t path_end = iri.find_first_of("?#", pos);
	const size_t end = (path_end == std::string::npos) ? iri.size() : path_end;
	parts.path = iri.substr(pos, end - pos);
	pos = end;

	if (pos < iri.size() && iri[pos] == '?')
	{
		const size_t query_end = iri.find('#', pos);
		const size_t qend = (query_end == std::string::npos) ? iri.size() : query_end;
		parts.query = iri.substr(pos + 1, qend - pos - 1);
		pos = qend;
	}

	if (pos < iri.size() && iri[pos] == '#')
		parts.fragment = iri.substr(pos + 1);

	return parts;
}


std::string join_iri(const IriParts& parts)
{
	std::string result;
	if (parts.scheme)
		result += *parts.scheme + ':';
	if (parts.authority)
		result += "//" + *parts.authority;
	result += parts.path;
	if (parts.query)
		result += '?' + *parts.query;
	if (parts.fragment)
		result += '#' + *parts.fragment;
	return result;
}


bool has_scheme(const std::string& iri)
{
	return scheme_length(iri) > 0;
}


std::string remove_dot_segments(const std::string& path)
{
	std::string input = path;
	std::string output;

	while (!input.empty())
	{
		if (input.compare(0, 3, "../") == 0)
		{
			input.erase(0, 3);
		}
		else if (input.compare(0, 2, "./") == 0)
		{
			input.erase(0, 2);
		}
		else if (input.compare(0, 3, "/./") == 0)
		{
			input.replace(0, 3, "/");
		}
		else if (input == "/.")
		{
			input = "/";
		}
		else if (input.compare(0, 4, "/../") == 0 || input == "/..")
		{
			input = (input.size() == 3) ? "/" : input.substr(3);

			// remove the last segment (and its preceding slash) from the output
			const auto last_slash = output.rfind('/');
			output.erase(last_slash == std::string::npos ? 0 : last_slash);
		}
		else if (input == "." || input == "..")
		{
			input.clear();
		}
		else
		{
			// move the first path segment, including its initial
			// slash if any, to the output
			const size_t seg_end = input.find('/', input[0] == '/' ? 1 : 0);
			const size_t len = (seg_end == std::string::npos) ? input.size() : seg_end;
			output += input.substr(0, len);
			input.erase(0, len);
		}
	}

	return output;
}


std::optional<std::string> resolve_iri(const std::string& base, const std::string& ref)
{
	if (has_scheme(ref))
		return ref;

	if (!has_scheme(base))
		return std::nullopt;

	const IriParts b = split_iri(base);
	const IriParts r = split_iri(ref);
	IriParts t;

	if (r.authority)
	{
		t.authority = r.authority;
		t.path = remove_dot_segments(r.path);
		t.query = r.query;
	}
	else
	{
		if (r.path.empty())
		{
			t.path = b.path;
			t.query = r.query ? r.query : b.query;
		}
		else
		{
			if (r.path[0] == '/')
				t.path = remove_dot_segments(r.path);
			else
				t.path = remove_dot_segments(merge_paths(b, r.path));
			t.query = r.query;
		}
		t.authority = b.authority;
	}

	t.scheme = b.scheme;
	t.fragment = r.fragment;

	return join_iri(t);
}


bool is_forbidden_in_iri(char32_t c)
{
	return c <= 0x20 || c == '<' || c == '>' || c == '"' || c == '{' || c == '}'
		|| c == '|' || c == '^' || c == '`' || c == '\\';
}


bool iri_chars_allowed(const std::string& iri)
{
	// every forbidden character is ASCII, so bytes will do
	for (char c : iri)
	{
		if (is_forbidden_in_iri(static_cast<unsigned char>(c)))
			return false;
	}
	return true;
}


std::string file_iri(const std::string& absolute_path)
{
	static const char HEX[] = "0123456789ABCDEF";

	// drive-letter paths have no leading slash
	std::string result = "file://";
	if (absolute_path.empty() || absolute_path[0] != '/')
		result += '/';

	for (char c : absolute_path)
	{
		if (c == '/' || is_unreserved(c) || is_sub_delim_or_pchar(c))
		{
			result += c;
		}
		else
		{
			const auto byte = static_cast<unsigned char>(c);
			result += '%';
			result += HEX[byte >> 4];
			result += HEX[byte & 0xF];
		}
	}

	return result;
}


}  // namespace rdfc
