#ifndef RDFC_IRI_H
#define RDFC_IRI_H


#include <string>
#include <optional>


namespace rdfc
{


/*
* The five components of an IRI reference, as in RFC 3986
* section 3. Each optional component distinguishes "absent"
* from "present but empty" (e.g. "http://a/b?" has an empty
* query, "http://a/b" has none).
*/
struct IriParts
{
	std::optional<std::string> scheme;
	std::optional<std::string> authority;
	std::string path;
	std::optional<std::string> query;
	std::optional<std::string> fragment;
};


IriParts split_iri(const std::string& iri);
std::string join_iri(const IriParts& parts);


/*
* True iff `iri` begins with a scheme, i.e. it is not a
* relative reference.
*/
bool has_scheme(const std::string& iri);


/*
* Apply the "remove_dot_segments" routine of RFC 3986
* section 5.2.4 to a path.
*/
std::string remove_dot_segments(const std::string& path);


/*
* Resolve the reference `ref` against `base`, following RFC 3986
* section 5.2.2. A reference which already has a scheme is
* returned unchanged. Returns std::nullopt if `ref` is relative
* and `base` is not an absolute IRI (in particular, if it is
* empty).
*/
std::optional<std::string> resolve_iri(const std::string& base, const std::string& ref);


/*
* Characters which may not appear in an IRI in any of the
* syntaxes, escaped or not: controls, space and <>"{}|^`\
*/
bool is_forbidden_in_iri(char32_t c);


/*
* True iff no character of `iri` is forbidden, so that it can
* be written out and read back in as an IRIREF.
*/
bool iri_chars_allowed(const std::string& iri);


/*
* The file: IRI for an absolute path (in generic, '/' separated
* form). Every byte of the path which is not an RFC 3986 pchar
* or '/' is percent-encoded, so the result is always writable.
*/
std::string file_iri(const std::string& absolute_path);


}  // namespace rdfc


#endif  // RDFC_IRI_H
