#ifndef RDFC_UTF8_H
#define RDFC_UTF8_H


#include <string>
#include <string_view>


namespace rdfc
{


/*
* True iff `cp` is a Unicode scalar value, i.e. it is at
* most U+10FFFF and is not a surrogate.
*/
bool is_scalar_value(char32_t cp);


/*
* Append the UTF-8 encoding of `cp` to `out`.
* Precondition: `is_scalar_value(cp)`.
*/
void append_utf8(std::string& out, char32_t cp);


/*
* Decode the UTF-8 sequence starting at byte offset `pos` of `s`.
* On success, writes the code point to `out_cp`, its encoded
* length in bytes to `out_len` and returns true. Returns false
* for truncated, overlong or otherwise malformed sequences, and
* for sequences encoding surrogates or values above U+10FFFF.
* Precondition: `pos < s.size()`.
*/
bool decode_utf8(std::string_view s, size_t pos, char32_t& out_cp, size_t& out_len);


}  // namespace rdfc


#endif  // RDFC_UTF8_H
